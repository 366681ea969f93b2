#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace rag_core {

// A contiguous slice of a source document. source_offset is the byte offset of the
// first character of text inside the document.
struct Chunk {
  std::string text;
  int ordinal = 0;
  size_t source_offset = 0;

  bool operator==(const Chunk &other) const = default;
};

inline void to_json(nlohmann::json &j, const Chunk &chunk) {
  j = nlohmann::json{
      {"text", chunk.text}, {"ordinal", chunk.ordinal}, {"source_offset", chunk.source_offset}};
}

inline void from_json(const nlohmann::json &j, Chunk &chunk) {
  j.at("text").get_to(chunk.text);
  j.at("ordinal").get_to(chunk.ordinal);
  j.at("source_offset").get_to(chunk.source_offset);
}

}  // namespace rag_core
