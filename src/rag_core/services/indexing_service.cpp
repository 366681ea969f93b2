#include "rag_core/services/indexing_service.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

#include "rag_core/errors.hpp"

namespace rag_core {

IndexingService::IndexingService(std::shared_ptr<EmbeddingPort> embedder,
                                 std::shared_ptr<VectorIndex> index, const Config &config)
    : embedder_(std::move(embedder)),
      index_(std::move(index)),
      chunker_(config.chunk_size, config.chunk_overlap),
      batch_size_(static_cast<size_t>(config.ollama.embed_batch_size)) {
  if (!embedder_ || !index_) {
    throw std::invalid_argument("IndexingService requires an embedder and an index");
  }
  if (batch_size_ == 0) {
    throw InvalidConfig("embed_batch_size must be greater than 0");
  }
}

std::vector<Vector> IndexingService::embed_chunks(const std::vector<Chunk> &chunks,
                                                  IndexingStats &stats) {
  std::vector<Vector> vectors;
  vectors.reserve(chunks.size());

  for (size_t begin = 0; begin < chunks.size(); begin += batch_size_) {
    const size_t end = std::min(begin + batch_size_, chunks.size());

    std::vector<std::string> texts;
    texts.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }

    std::vector<Vector> batch = embedder_->embed_many(texts);
    ++stats.embedding_calls;
    if (batch.size() != texts.size()) {
      throw EmbeddingServiceError("Embedding batch returned " + std::to_string(batch.size()) +
                                  " vectors for " + std::to_string(texts.size()) + " texts");
    }
    std::move(batch.begin(), batch.end(), std::back_inserter(vectors));
  }
  return vectors;
}

void IndexingService::insert_chunks(const std::vector<Chunk> &chunks,
                                    const std::vector<Vector> &vectors, IndexingStats &stats) {
  for (size_t i = 0; i < chunks.size(); ++i) {
    index_->insert(vectors[i], chunks[i]);
    ++stats.chunk_count;
  }
  std::cout << "[IndexingService] Indexed " << stats.chunk_count << " chunks with "
            << stats.embedding_calls << " embedding calls." << std::endl;
}

IndexingStats IndexingService::index_document(const std::string &text) {
  IndexingStats stats;
  const std::vector<Chunk> chunks = chunker_.split(text);
  if (chunks.empty()) {
    std::cout << "[IndexingService] Document is empty, nothing to index." << std::endl;
    return stats;
  }

  const std::vector<Vector> vectors = embed_chunks(chunks, stats);
  insert_chunks(chunks, vectors, stats);
  return stats;
}

IndexingStats IndexingService::replace_document(const std::string &text) {
  IndexingStats stats;
  const std::vector<Chunk> chunks = chunker_.split(text);
  const std::vector<Vector> vectors = embed_chunks(chunks, stats);

  index_->clear();
  if (chunks.empty()) {
    std::cout << "[IndexingService] Document is empty, index cleared." << std::endl;
    return stats;
  }
  try {
    insert_chunks(chunks, vectors, stats);
  } catch (const RagError &e) {
    std::cerr << "[IndexingService] Insert failed, clearing partial index: " << e.what()
              << std::endl;
    index_->clear();
    throw;
  }
  return stats;
}

}  // namespace rag_core
