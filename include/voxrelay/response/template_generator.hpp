#pragma once

#include "voxrelay/response/generator.hpp"

#include <string>
#include <vector>

namespace voxrelay::response {

/// Canned reply selected when any keyword occurs in the utterance. Single-word
/// keywords match whole words; phrases match as substrings. Case-insensitive.
struct TemplateRule {
  std::vector<std::string> keywords;
  std::string reply;
};

/// Splits at whitespace; every fragment but the last keeps one trailing space so
/// the concatenation reads naturally.
[[nodiscard]] std::vector<std::string> split_word_fragments(const std::string &text);

class TemplateResponseGenerator final : public IResponseGenerator {
public:
  /// `rules` are consulted before the built-in ones.
  explicit TemplateResponseGenerator(std::vector<TemplateRule> rules = {});

  [[nodiscard]] std::unique_ptr<IFragmentStream> generate(const GenerationInput &input) override;
  [[nodiscard]] std::string_view name() const override { return "template"; }

  [[nodiscard]] std::string compose_reply(const std::string &utterance) const;

  [[nodiscard]] static std::vector<TemplateRule> builtin_rules();

private:
  std::vector<TemplateRule> rules_;
};

} // namespace voxrelay::response
