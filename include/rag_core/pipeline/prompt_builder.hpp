#pragma once

#include <string>
#include <vector>

#include "rag_core/pipeline/runnable.hpp"

namespace rag_core {

// Grounding prompt used when no template is supplied. Placeholders: {context}, {question}.
extern const char *const DEFAULT_GROUNDING_TEMPLATE;

/**
 * @class PromptBuilder
 * @brief Fills `{name}` placeholders of a template from a Bundle.
 *
 * `{{` and `}}` stand for literal braces. String values are inserted verbatim, any other
 * value as its JSON text.
 */
class PromptBuilder : public Runnable {
 public:
  // Throws InvalidConfig on an unbalanced or empty placeholder
  explicit PromptBuilder(std::string template_text = DEFAULT_GROUNDING_TEMPLATE);

  // Placeholder names in order of first appearance
  const std::vector<std::string> &required_variables() const { return variables_; }

  // Throws MissingVariable if a placeholder has no key in the bundle
  std::string format(const Value &bundle) const;

  std::string label() const override { return "PromptBuilder"; }
  std::string input_shape() const override;
  std::string output_shape() const override { return "String"; }

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  struct Segment {
    bool is_variable;
    std::string text;
  };

  std::string template_;
  std::vector<Segment> segments_;
  std::vector<std::string> variables_;

  void parse_template();
};

}  // namespace rag_core
