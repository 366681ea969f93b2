#include "rag_core/pipeline/output_parser.hpp"

#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

OutputParser::OutputParser(std::string field) : field_(std::move(field)) {}

std::string OutputParser::parse(const Value &raw_response) const {
  if (!raw_response.is_object()) {
    throw MalformedResponse("Expected a JSON object response, got " +
                            std::string(raw_response.type_name()));
  }
  auto it = raw_response.find(field_);
  if (it == raw_response.end()) {
    throw MalformedResponse("Response does not contain '" + field_ + "' field");
  }
  if (!it->is_string()) {
    throw MalformedResponse("Response field '" + field_ + "' is not a string");
  }
  return it->get<std::string>();
}

Value OutputParser::run(const Value &input, const RunContext & /*context*/) const {
  return parse(input);
}

}  // namespace rag_core
