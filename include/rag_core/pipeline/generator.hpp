#pragma once

#include <memory>
#include <string>

#include "rag_core/llm/generation_port.hpp"
#include "rag_core/pipeline/runnable.hpp"

namespace rag_core {

// Prompt string in, RawResponse out. Failures are the port's GenerationServiceError.
class Generator : public Runnable {
 public:
  explicit Generator(std::shared_ptr<GenerationPort> port);

  std::string label() const override { return "Generator"; }
  std::string input_shape() const override { return "String"; }
  std::string output_shape() const override { return "RawResponse"; }

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  std::shared_ptr<GenerationPort> port_;
};

}  // namespace rag_core
