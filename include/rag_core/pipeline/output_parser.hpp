#pragma once

#include <string>

#include "rag_core/pipeline/runnable.hpp"

namespace rag_core {

// Extracts the textual answer from a RawResponse.
class OutputParser : public Runnable {
 public:
  explicit OutputParser(std::string field = "response");

  // Throws MalformedResponse if the field is absent or not a string
  std::string parse(const Value &raw_response) const;

  std::string label() const override { return "OutputParser"; }
  std::string input_shape() const override { return "RawResponse"; }
  std::string output_shape() const override { return "String"; }

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  std::string field_;
};

}  // namespace rag_core
