#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <shared_mutex>

#include "rag_core/index/vector_index.hpp"

namespace rag_core {

/**
 * @class FlatVectorIndex
 * @brief Exhaustive VectorIndex: every query scores every entry.
 *
 * Scoring runs on a faiss flat index (inner product over L2-normalised copies for cosine,
 * L2 for the Euclidean metric). O(n * d) per query, fine for a single document's chunks.
 * Concurrent queries are safe; inserts and clear take an exclusive lock.
 */
class FlatVectorIndex : public VectorIndex {
 public:
  explicit FlatVectorIndex(SimilarityMetric metric = SimilarityMetric::Cosine);
  // Fixes the dimensionality up front instead of on first insertion
  FlatVectorIndex(SimilarityMetric metric, size_t dimension);
  ~FlatVectorIndex() override;

  // Disable copy constructor and assignment
  FlatVectorIndex(const FlatVectorIndex &) = delete;
  FlatVectorIndex &operator=(const FlatVectorIndex &) = delete;

  int64_t insert(const Vector &vector, const Chunk &payload) override;
  QueryResult query(const Vector &vector, int k) const override;
  size_t count() const override;
  void clear() override;
  std::optional<size_t> dimension() const override;
  SimilarityMetric metric() const override { return metric_; }

 private:
  SimilarityMetric metric_;
  std::optional<size_t> dimension_;
  bool fixed_dimension_ = false;
  std::unique_ptr<faiss::IndexFlat> faiss_index_;
  // Position i in faiss_index_ holds entries_[i]
  std::vector<IndexEntry> entries_;
  int64_t next_id_ = 0;
  mutable std::shared_mutex mutex_;

  std::unique_ptr<faiss::IndexFlat> create_base_index(size_t dimension) const;
  void validate_vector_dimension(const Vector &vector, const char *operation) const;
  Vector prepare_for_index(const Vector &vector) const;
};

}  // namespace rag_core
