#pragma once

#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

// What one unit of chunk size and overlap counts
enum class LengthUnit {
  CodePoint,  // Unicode code points
  Word,       // a run of non-space bytes plus the whitespace after it
};

/**
 * @class TextChunker
 * @brief Splits a document into overlapping, bounded chunks.
 *
 * Sizes are counted in LengthUnit units, code points by default. Word units approximate a
 * token budget for models whose context limit is counted in tokens. Each chunk ends at the best boundary found in
 * its window: a paragraph break first, then a sentence end or line break, then a space, and
 * only as a last resort a hard cut. Consecutive chunks share exactly `overlap` units, so
 * dropping the first `overlap` units of every chunk but the first and concatenating
 * reconstructs the document.
 */
class TextChunker {
 public:
  /**
   * @throws InvalidConfig if size <= 0, overlap < 0 or overlap >= size.
   */
  TextChunker(int size, int overlap, LengthUnit unit = LengthUnit::CodePoint);

  // An empty document yields no chunks.
  std::vector<Chunk> split(const std::string &text) const;

  int size() const { return size_; }
  int overlap() const { return overlap_; }
  LengthUnit unit() const { return unit_; }

 private:
  int size_;
  int overlap_;
  LengthUnit unit_;

  // Index (in units) one past the end of the chunk starting at `start`.
  size_t find_break(const std::string &text, const std::vector<size_t> &offsets, size_t start,
                    size_t count) const;
};

// Convenience wrapper around TextChunker.
std::vector<Chunk> split_text(const std::string &text, int size, int overlap,
                              LengthUnit unit = LengthUnit::CodePoint);

}  // namespace rag_core
