#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace rag_core {

// Unparsed model reply, handed to an OutputParser.
using RawResponse = nlohmann::json;

class GenerationPort {
 public:
  virtual ~GenerationPort() = default;

  // Throws GenerationServiceError on network, quota or model failure
  virtual RawResponse generate(const std::string &prompt) = 0;
};

}  // namespace rag_core
