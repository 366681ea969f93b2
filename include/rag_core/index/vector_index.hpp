#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"
#include "rag_core/types/vector.hpp"

namespace rag_core {

enum class SimilarityMetric {
  // Cosine similarity in [-1, 1]; a zero vector scores 0 against everything.
  Cosine,
  // Negated squared L2 distance, so larger is still more similar.
  NegativeSquaredEuclidean
};

std::string to_string(SimilarityMetric metric);

struct IndexEntry {
  int64_t id;
  Vector vector;
  Chunk payload;
};

struct ScoredEntry {
  IndexEntry entry;
  float score;
};

// Ordered by decreasing score, equal scores by ascending entry id.
using QueryResult = std::vector<ScoredEntry>;

/**
 * @class VectorIndex
 * @brief Nearest-neighbour search over dense vectors with chunk payloads.
 *
 * The dimensionality is established by the first insertion (or fixed up front by an
 * implementation) and every later insert or query must match it. Implementations may be
 * exhaustive or approximate; callers only rely on this contract.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  /**
   * @brief Stores a vector and its payload. The entry is queryable immediately.
   * @return A unique id, strictly greater than every id handed out before.
   * @throws DimensionMismatch if the vector length differs from the index dimensionality.
   */
  virtual int64_t insert(const Vector &vector, const Chunk &payload) = 0;

  /**
   * @brief Returns the min(k, count()) entries most similar to `vector`.
   * @throws std::invalid_argument if k <= 0.
   * @throws DimensionMismatch if the vector length differs from the index dimensionality.
   */
  virtual QueryResult query(const Vector &vector, int k) const = 0;

  virtual size_t count() const = 0;

  // Drops every entry. Ids are not reused afterwards. A dimensionality that was
  // established by insertion is forgotten; one fixed at construction is kept.
  virtual void clear() = 0;

  virtual std::optional<size_t> dimension() const = 0;
  virtual SimilarityMetric metric() const = 0;
};

}  // namespace rag_core
