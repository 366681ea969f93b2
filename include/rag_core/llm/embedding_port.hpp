#pragma once

#include <string>
#include <vector>

#include "rag_core/types/vector.hpp"

namespace rag_core {

/**
 * @class EmbeddingPort
 * @brief Text to fixed-length dense vector.
 *
 * embed_many(xs)[i] must equal embed(xs[i]); the batch form only saves round trips.
 * Failures surface as EmbeddingServiceError and are never retried here.
 */
class EmbeddingPort {
 public:
  virtual ~EmbeddingPort() = default;

  virtual Vector embed(const std::string &text) = 0;

  virtual std::vector<Vector> embed_many(const std::vector<std::string> &texts) {
    std::vector<Vector> vectors;
    vectors.reserve(texts.size());
    for (const auto &text : texts) {
      vectors.push_back(embed(text));
    }
    return vectors;
  }
};

}  // namespace rag_core
