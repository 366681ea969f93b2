#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedding_port.hpp"
#include "rag_core/pipeline/runnable.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

/**
 * @class Retriever
 * @brief Query text to ranked chunks: embeds the query, then asks the index.
 *
 * As a Runnable it maps a query string to a JSON array of chunks in rank order.
 */
class Retriever : public Runnable {
 public:
  Retriever(std::shared_ptr<EmbeddingPort> embedder, std::shared_ptr<const VectorIndex> index,
            int k);

  // Payloads of the top-k entries, best first. Scores are dropped.
  std::vector<Chunk> retrieve(const std::string &query_text, int k) const;
  std::vector<Chunk> retrieve(const std::string &query_text) const;

  int k() const { return k_; }

  std::string label() const override { return "Retriever"; }
  std::string input_shape() const override { return "String"; }
  std::string output_shape() const override { return "Chunk[]"; }

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  std::shared_ptr<EmbeddingPort> embedder_;
  std::shared_ptr<const VectorIndex> index_;
  int k_;
};

// Chunk texts in rank order joined by `separator`.
std::string format_documents(const std::vector<Chunk> &chunks,
                             const std::string &separator = "\n\n");

// Runnable form of format_documents: Chunk[] in, String out.
RunnablePtr make_document_formatter(const std::string &separator = "\n\n");

}  // namespace rag_core
