#include "internal/suggestion/relevance_scorer.hpp"

#include <cctype>
#include <set>

#include "internal/util/errors.hpp"

namespace chainweave::suggestion {

std::vector<std::string> Tokenize(const std::string& text) {
  std::vector<std::string> tokens;
  std::string              current;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

Relevance TagOverlapScorer::Score(const std::string& goal_text, const model::PluginDescriptor& descriptor, const SuggestionContext&) const {
  Relevance relevance;

  std::set<std::string> goal_words;
  for (auto& word : Tokenize(goal_text)) goal_words.insert(std::move(word));
  if (goal_words.empty()) return relevance;

  std::set<std::string> vocabulary;
  auto                  absorb = [&vocabulary](const std::string& text) {
    for (auto& word : Tokenize(text)) vocabulary.insert(std::move(word));
  };
  absorb(descriptor.name);
  absorb(descriptor.description);
  absorb(descriptor.category);
  for (const auto& tag : descriptor.input_types) absorb(tag);
  for (const auto& tag : descriptor.output_types) absorb(tag);

  std::size_t matched = 0;
  for (const auto& word : goal_words) {
    if (vocabulary.count(word) > 0) {
      ++matched;
      relevance.reasons.push_back("matched '" + word + "'");
    }
  }
  relevance.score = static_cast<double>(matched) / static_cast<double>(goal_words.size());
  return relevance;
}

FunctionScorer::FunctionScorer(Fn fn) : fn_(std::move(fn)) {
  if (!fn_) {
    throw util::InvalidArgument("function scorer requires a callable");
  }
}

Relevance FunctionScorer::Score(const std::string& goal_text, const model::PluginDescriptor& descriptor, const SuggestionContext& context) const {
  return fn_(goal_text, descriptor, context);
}

} // namespace chainweave::suggestion
