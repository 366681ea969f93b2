#include "rag_core/services/retriever.hpp"

#include <stdexcept>
#include <utility>

#include "rag_core/pipeline/combinators.hpp"

namespace rag_core {

Retriever::Retriever(std::shared_ptr<EmbeddingPort> embedder,
                     std::shared_ptr<const VectorIndex> index, int k)
    : embedder_(std::move(embedder)), index_(std::move(index)), k_(k) {
  if (!embedder_ || !index_) {
    throw std::invalid_argument("Retriever requires an embedder and an index");
  }
  if (k_ <= 0) {
    throw std::invalid_argument("Retriever k must be greater than 0");
  }
}

std::vector<Chunk> Retriever::retrieve(const std::string &query_text, int k) const {
  const Vector query_vector = embedder_->embed(query_text);
  const QueryResult hits = index_->query(query_vector, k);

  std::vector<Chunk> chunks;
  chunks.reserve(hits.size());
  for (const auto &hit : hits) {
    chunks.push_back(hit.entry.payload);
  }
  return chunks;
}

std::vector<Chunk> Retriever::retrieve(const std::string &query_text) const {
  return retrieve(query_text, k_);
}

Value Retriever::run(const Value &input, const RunContext & /*context*/) const {
  if (!input.is_string()) {
    throw std::invalid_argument("Retriever expects a query string, got " +
                                std::string(input.type_name()));
  }
  return retrieve(input.get<std::string>());
}

std::string format_documents(const std::vector<Chunk> &chunks, const std::string &separator) {
  std::string formatted;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0) {
      formatted += separator;
    }
    formatted += chunks[i].text;
  }
  return formatted;
}

RunnablePtr make_document_formatter(const std::string &separator) {
  return make_lambda(
      "FormatDocuments",
      [separator](const Value &input) -> Value {
        if (!input.is_array()) {
          throw std::invalid_argument("FormatDocuments expects a chunk array, got " +
                                      std::string(input.type_name()));
        }
        std::vector<Chunk> chunks;
        try {
          chunks = input.get<std::vector<Chunk>>();
        } catch (const nlohmann::json::exception &e) {
          throw std::invalid_argument("FormatDocuments got a malformed chunk: " +
                                      std::string(e.what()));
        }
        return format_documents(chunks, separator);
      },
      "Chunk[]", "String");
}

}  // namespace rag_core
