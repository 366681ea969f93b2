#pragma once

#include <vector>

namespace rag_core {

// Dense embedding. Dimensionality is fixed per EmbeddingPort instance.
using Vector = std::vector<float>;

}  // namespace rag_core
