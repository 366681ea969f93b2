#include "rag_core/pipeline/prompt_builder.hpp"

#include <algorithm>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

const char *const DEFAULT_GROUNDING_TEMPLATE =
    "Answer the question based only on the context below. If the context does not contain "
    "the answer, reply \"I don't know\".\n"
    "\n"
    "Context:\n"
    "{context}\n"
    "\n"
    "Question: {question}\n";

PromptBuilder::PromptBuilder(std::string template_text) : template_(std::move(template_text)) {
  parse_template();
}

void PromptBuilder::parse_template() {
  std::string literal;
  size_t i = 0;
  while (i < template_.size()) {
    const char c = template_[i];
    if (c == '{' && i + 1 < template_.size() && template_[i + 1] == '{') {
      literal += '{';
      i += 2;
    } else if (c == '}' && i + 1 < template_.size() && template_[i + 1] == '}') {
      literal += '}';
      i += 2;
    } else if (c == '{') {
      const size_t close = template_.find('}', i + 1);
      if (close == std::string::npos) {
        throw InvalidConfig("Unterminated placeholder at position " + std::to_string(i));
      }
      std::string name = template_.substr(i + 1, close - i - 1);
      if (name.empty() || name.find('{') != std::string::npos) {
        throw InvalidConfig("Invalid placeholder at position " + std::to_string(i));
      }
      if (!literal.empty()) {
        segments_.push_back({.is_variable = false, .text = std::move(literal)});
        literal.clear();
      }
      if (std::find(variables_.begin(), variables_.end(), name) == variables_.end()) {
        variables_.push_back(name);
      }
      segments_.push_back({.is_variable = true, .text = std::move(name)});
      i = close + 1;
    } else if (c == '}') {
      throw InvalidConfig("Unmatched '}' at position " + std::to_string(i));
    } else {
      literal += c;
      ++i;
    }
  }
  if (!literal.empty()) {
    segments_.push_back({.is_variable = false, .text = std::move(literal)});
  }
}

std::string PromptBuilder::format(const Value &bundle) const {
  if (!variables_.empty() && !bundle.is_object()) {
    throw MissingVariable("Prompt input must be a bundle, got " +
                          std::string(bundle.type_name()));
  }

  std::string prompt;
  for (const auto &segment : segments_) {
    if (!segment.is_variable) {
      prompt += segment.text;
      continue;
    }
    auto it = bundle.find(segment.text);
    if (it == bundle.end()) {
      throw MissingVariable("Missing prompt variable: " + segment.text);
    }
    prompt += it->is_string() ? it->get<std::string>() : it->dump();
  }
  return prompt;
}

std::string PromptBuilder::input_shape() const {
  std::string keys;
  for (const auto &variable : variables_) {
    if (!keys.empty()) {
      keys += ",";
    }
    keys += variable;
  }
  return "Bundle{" + keys + "}";
}

Value PromptBuilder::run(const Value &input, const RunContext & /*context*/) const {
  return format(input);
}

}  // namespace rag_core
