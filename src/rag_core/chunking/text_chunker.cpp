#include "rag_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <cstddef>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

// Byte offset of every code point, plus a trailing entry for text.size().
std::vector<size_t> code_point_offsets(const std::string &text) {
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  auto it = text.begin();
  while (it != text.end()) {
    const size_t position = static_cast<size_t>(it - text.begin());
    offsets.push_back(position);
    try {
      utf8::next(it, text.end());
    } catch (const utf8::exception &) {
      // An invalid byte counts as a character of its own
      it = text.begin() + static_cast<std::ptrdiff_t>(position + 1);
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Byte offset of every word, plus a trailing entry for text.size(). Leading whitespace
// forms a word of its own.
std::vector<size_t> word_offsets(const std::string &text) {
  std::vector<size_t> offsets;
  size_t position = 0;
  while (position < text.size()) {
    offsets.push_back(position);
    while (position < text.size() && !is_space(text[position])) {
      ++position;
    }
    while (position < text.size() && is_space(text[position])) {
      ++position;
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

std::vector<size_t> unit_offsets(const std::string &text, LengthUnit unit) {
  if (unit == LengthUnit::Word) {
    return word_offsets(text);
  }
  return code_point_offsets(text);
}

}  // namespace

TextChunker::TextChunker(int size, int overlap, LengthUnit unit)
    : size_(size), overlap_(overlap), unit_(unit) {
  if (size_ <= 0) {
    throw InvalidConfig("Chunk size must be greater than 0, got " + std::to_string(size_));
  }
  if (overlap_ < 0 || overlap_ >= size_) {
    throw InvalidConfig("Chunk overlap must be in [0, " + std::to_string(size_) + "), got " +
                        std::to_string(overlap_));
  }
}

/**
 * @brief Picks the end of the chunk that starts at unit `start`.
 *
 * Candidate ends lie in (start + overlap, start + size] so every chunk fits the size limit and
 * the next chunk, which starts `overlap` units before this end, always makes progress.
 * A separator stays with the chunk it terminates. Boundaries are judged on the bytes just
 * before a unit edge, so the same rules serve code points and words.
 */
size_t TextChunker::find_break(const std::string &text, const std::vector<size_t> &offsets,
                               size_t start, size_t count) const {
  const size_t hard_end = start + static_cast<size_t>(size_);
  const size_t min_end = start + static_cast<size_t>(overlap_) + 1;

  // Byte `back` positions before the edge at unit `end`
  auto byte_before = [&](size_t end, size_t back) {
    return offsets[end] >= back ? text[offsets[end] - back] : '\0';
  };

  size_t sentence_end = 0;
  size_t space_end = 0;
  // Walk backwards so the first hit of each kind is the latest one in the window
  for (size_t end = hard_end; end >= min_end; --end) {
    const char last = byte_before(end, 1);
    const char prev = byte_before(end, 2);

    if (last == '\n' && prev == '\n') {
      return end;
    }
    if (sentence_end == 0) {
      if (last == '\n') {
        sentence_end = end;
      } else if (is_space(last) && (prev == '.' || prev == '!' || prev == '?')) {
        sentence_end = end;
      }
    }
    if (space_end == 0 && is_space(last)) {
      space_end = end;
    }
    if (end == min_end) {
      break;
    }
  }

  if (sentence_end != 0) {
    return sentence_end;
  }
  if (space_end != 0) {
    return space_end;
  }
  return hard_end < count ? hard_end : count;
}

std::vector<Chunk> TextChunker::split(const std::string &text) const {
  std::vector<Chunk> chunks;
  if (text.empty()) {
    return chunks;
  }

  const std::vector<size_t> offsets = unit_offsets(text, unit_);
  const size_t count = offsets.size() - 1;

  size_t start = 0;
  int ordinal = 0;
  while (true) {
    size_t end;
    if (count - start <= static_cast<size_t>(size_)) {
      end = count;
    } else {
      end = find_break(text, offsets, start, count);
    }

    const size_t begin_byte = offsets[start];
    chunks.push_back({.text = text.substr(begin_byte, offsets[end] - begin_byte),
                      .ordinal = ordinal++,
                      .source_offset = begin_byte});

    if (end == count) {
      break;
    }
    start = end - static_cast<size_t>(overlap_);
  }

  return chunks;
}

std::vector<Chunk> split_text(const std::string &text, int size, int overlap, LengthUnit unit) {
  return TextChunker(size, overlap, unit).split(text);
}

}  // namespace rag_core
