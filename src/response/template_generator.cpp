#include "voxrelay/response/template_generator.hpp"

#include "voxrelay/common/fs.hpp"

#include <cctype>
#include <sstream>

namespace voxrelay::response {

namespace {

std::vector<std::string> lowercase_words(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : text) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '\'') {
      current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
      continue;
    }
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

bool keyword_matches(const std::string &keyword, const std::string &lowered,
                     const std::vector<std::string> &words) {
  const std::string needle = common::to_lower(common::trim(keyword));
  if (needle.empty()) {
    return false;
  }
  if (needle.find(' ') != std::string::npos) {
    return lowered.find(needle) != std::string::npos;
  }
  for (const auto &word : words) {
    if (word == needle) {
      return true;
    }
  }
  return false;
}

} // namespace

std::vector<std::string> split_word_fragments(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  for (std::size_t i = 0; i + 1 < words.size(); ++i) {
    words[i].push_back(' ');
  }
  return words;
}

std::vector<TemplateRule> TemplateResponseGenerator::builtin_rules() {
  return {
      {.keywords = {"hello", "hi"}, .reply = "Hello! How can I help you today?"},
      {.keywords = {"how are you"},
       .reply = "I'm doing great, thanks for asking! How about you?"},
      {.keywords = {"weather"},
       .reply = "I don't have access to real-time weather data, but I hope it's nice where you "
                "are!"},
      {.keywords = {"bye", "goodbye"}, .reply = "Goodbye! Have a great day!"},
  };
}

TemplateResponseGenerator::TemplateResponseGenerator(std::vector<TemplateRule> rules)
    : rules_(std::move(rules)) {
  for (auto &rule : builtin_rules()) {
    rules_.push_back(std::move(rule));
  }
}

std::string TemplateResponseGenerator::compose_reply(const std::string &utterance) const {
  const std::string cleaned = common::trim(utterance);
  const std::string lowered = common::to_lower(cleaned);
  const auto words = lowercase_words(cleaned);

  for (const auto &rule : rules_) {
    for (const auto &keyword : rule.keywords) {
      if (keyword_matches(keyword, lowered, words)) {
        return rule.reply;
      }
    }
  }
  return "You said: " + cleaned + ". How can I help you with that?";
}

std::unique_ptr<IFragmentStream> TemplateResponseGenerator::generate(const GenerationInput &input) {
  return std::make_unique<StaticFragmentStream>(split_word_fragments(compose_reply(input.utterance)));
}

} // namespace voxrelay::response
