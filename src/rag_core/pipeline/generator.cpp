#include "rag_core/pipeline/generator.hpp"

#include <stdexcept>
#include <utility>

namespace rag_core {

Generator::Generator(std::shared_ptr<GenerationPort> port) : port_(std::move(port)) {
  if (!port_) {
    throw std::invalid_argument("Generator requires a generation port");
  }
}

Value Generator::run(const Value &input, const RunContext & /*context*/) const {
  if (!input.is_string()) {
    throw std::invalid_argument("Generator expects a prompt string, got " +
                                std::string(input.type_name()));
  }
  return port_->generate(input.get<std::string>());
}

}  // namespace rag_core
