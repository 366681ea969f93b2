#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/config.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedding_port.hpp"

namespace rag_core {

struct IndexingStats {
  size_t chunk_count = 0;
  size_t embedding_calls = 0;
};

/**
 * @class IndexingService
 * @brief Chunks a document, embeds the chunks in batches and inserts them into an index.
 *
 * Embedding calls are bounded by ceil(chunks / embed_batch_size), not by the chunk count.
 */
class IndexingService {
 public:
  IndexingService(std::shared_ptr<EmbeddingPort> embedder, std::shared_ptr<VectorIndex> index,
                  const Config &config);

  // Appends the document's chunks to the index
  IndexingStats index_document(const std::string &text);

  /**
   * @brief Swaps the index contents for the document's chunks.
   *
   * Every batch is embedded before the index is touched, so an embedding failure leaves the
   * previous contents in place. A failed insert empties the index before rethrowing.
   */
  IndexingStats replace_document(const std::string &text);

 private:
  std::vector<Vector> embed_chunks(const std::vector<Chunk> &chunks, IndexingStats &stats);
  void insert_chunks(const std::vector<Chunk> &chunks, const std::vector<Vector> &vectors,
                     IndexingStats &stats);

  std::shared_ptr<EmbeddingPort> embedder_;
  std::shared_ptr<VectorIndex> index_;
  TextChunker chunker_;
  size_t batch_size_;
};

}  // namespace rag_core
