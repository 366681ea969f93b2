#include "rag_core/index/flat_vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

double squared_norm(const Vector &vector) {
  double sum = 0.0;
  for (float value : vector) {
    sum += static_cast<double>(value) * value;
  }
  return sum;
}

// Recomputed in double from the raw vectors and rounded once to float, so scaled copies of
// one direction land on the same score and fall through to the id tie-break.
float exact_score(SimilarityMetric metric, const Vector &query, double query_norm,
                  const Vector &stored) {
  if (metric == SimilarityMetric::NegativeSquaredEuclidean) {
    double distance = 0.0;
    for (size_t i = 0; i < query.size(); ++i) {
      const double diff = static_cast<double>(query[i]) - stored[i];
      distance += diff * diff;
    }
    return static_cast<float>(-distance);
  }

  const double stored_norm = std::sqrt(squared_norm(stored));
  if (query_norm == 0.0 || stored_norm == 0.0) {
    return 0.0f;
  }
  double dot = 0.0;
  for (size_t i = 0; i < query.size(); ++i) {
    dot += static_cast<double>(query[i]) * stored[i];
  }
  return static_cast<float>(dot / (query_norm * stored_norm));
}

}  // namespace

std::string to_string(SimilarityMetric metric) {
  switch (metric) {
    case SimilarityMetric::Cosine:
      return "cosine";
    case SimilarityMetric::NegativeSquaredEuclidean:
      return "negative_squared_euclidean";
  }
  return "unknown";
}

FlatVectorIndex::FlatVectorIndex(SimilarityMetric metric) : metric_(metric) {}

FlatVectorIndex::FlatVectorIndex(SimilarityMetric metric, size_t dimension)
    : metric_(metric), dimension_(dimension), fixed_dimension_(true) {
  if (dimension == 0) {
    throw std::invalid_argument("FlatVectorIndex dimension must be greater than 0");
  }
  faiss_index_ = create_base_index(dimension);
}

FlatVectorIndex::~FlatVectorIndex() = default;

std::unique_ptr<faiss::IndexFlat> FlatVectorIndex::create_base_index(size_t dimension) const {
  const auto d = static_cast<faiss::idx_t>(dimension);
  if (metric_ == SimilarityMetric::Cosine) {
    return std::make_unique<faiss::IndexFlatIP>(d);
  }
  return std::make_unique<faiss::IndexFlatL2>(d);
}

void FlatVectorIndex::validate_vector_dimension(const Vector &vector,
                                                const char *operation) const {
  if (vector.size() != *dimension_) {
    throw DimensionMismatch(std::string("Vector dimension mismatch on ") + operation +
                            ". Expected " + std::to_string(*dimension_) + ", got " +
                            std::to_string(vector.size()));
  }
}

Vector FlatVectorIndex::prepare_for_index(const Vector &vector) const {
  Vector prepared = vector;
  if (metric_ == SimilarityMetric::Cosine) {
    faiss::fvec_renorm_L2(prepared.size(), 1, prepared.data());
  }
  return prepared;
}

int64_t FlatVectorIndex::insert(const Vector &vector, const Chunk &payload) {
  std::unique_lock lock(mutex_);

  if (!dimension_) {
    if (vector.empty()) {
      throw DimensionMismatch("Cannot establish index dimensionality from an empty vector");
    }
    dimension_ = vector.size();
    faiss_index_ = create_base_index(*dimension_);
  }
  validate_vector_dimension(vector, "insert");

  const Vector prepared = prepare_for_index(vector);
  try {
    faiss_index_->add(1, prepared.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vector to index: " + std::string(e.what()));
  }

  const int64_t id = next_id_++;
  entries_.push_back({.id = id, .vector = vector, .payload = payload});
  return id;
}

/**
 * @brief Scores every entry, then orders by (score desc, id asc) and keeps the top k.
 *
 * faiss is asked for all ntotal neighbours so that ties straddling the k-th place are
 * resolved by id rather than by whatever order the backend happened to emit. The float
 * scores faiss returns carry rounding noise from renormalisation, so each candidate is
 * rescored with exact_score before ranking.
 */
QueryResult FlatVectorIndex::query(const Vector &vector, int k) const {
  if (k <= 0) {
    throw std::invalid_argument("k must be greater than 0, got " + std::to_string(k));
  }

  std::shared_lock lock(mutex_);
  if (dimension_) {
    validate_vector_dimension(vector, "query");
  }
  if (entries_.empty()) {
    return {};
  }

  const auto total = static_cast<faiss::idx_t>(entries_.size());
  std::vector<float> distances(entries_.size());
  std::vector<faiss::idx_t> labels(entries_.size());
  const Vector prepared = prepare_for_index(vector);
  try {
    faiss_index_->search(1, prepared.data(), total, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Index search failed: " + std::string(e.what()));
  }

  const double query_norm = std::sqrt(squared_norm(vector));
  std::vector<std::pair<float, size_t>> ranked;
  ranked.reserve(entries_.size());
  for (faiss::idx_t label : labels) {
    if (label < 0) {
      continue;
    }
    const auto position = static_cast<size_t>(label);
    ranked.emplace_back(exact_score(metric_, vector, query_norm, entries_[position].vector),
                        position);
  }

  const size_t top_k = std::min(static_cast<size_t>(k), ranked.size());
  // Positions follow insertion order, so comparing positions compares ids
  std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(top_k),
                    ranked.end(), [](const auto &a, const auto &b) {
                      if (a.first != b.first) {
                        return a.first > b.first;
                      }
                      return a.second < b.second;
                    });

  QueryResult results;
  results.reserve(top_k);
  for (size_t i = 0; i < top_k; ++i) {
    results.push_back({.entry = entries_[ranked[i].second], .score = ranked[i].first});
  }
  return results;
}

size_t FlatVectorIndex::count() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void FlatVectorIndex::clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  if (fixed_dimension_) {
    faiss_index_->reset();
  } else {
    dimension_.reset();
    faiss_index_.reset();
  }
}

std::optional<size_t> FlatVectorIndex::dimension() const {
  std::shared_lock lock(mutex_);
  return dimension_;
}

}  // namespace rag_core
