#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/plugin_descriptor.hpp"
#include "internal/model/value.hpp"

namespace chainweave::suggestion {

struct SuggestionContext {
  // tags the caller can already supply; used as seed inputs
  model::TagSet available_tags;

  std::map<std::string, std::string> attributes;
};

struct Relevance {
  double                   score = 0.0;
  std::vector<std::string> reasons;
};

/*
  Rates how relevant a plugin is to a free-text goal. Implementations may
  return any score; the engine clamps it to [0, 1].
*/
class RelevanceScorer {
 public:
  virtual ~RelevanceScorer() = default;

  virtual Relevance Score(const std::string& goal_text, const model::PluginDescriptor& descriptor, const SuggestionContext& context) const = 0;
};

/*
  Keyword scorer: fraction of the goal's words found among the words of the
  plugin's name, description, category and tags.
*/
class TagOverlapScorer final : public RelevanceScorer {
 public:
  Relevance Score(const std::string& goal_text, const model::PluginDescriptor& descriptor, const SuggestionContext& context) const override;
};

class FunctionScorer final : public RelevanceScorer {
 public:
  using Fn = std::function<Relevance(const std::string&, const model::PluginDescriptor&, const SuggestionContext&)>;

  explicit FunctionScorer(Fn fn);

  Relevance Score(const std::string& goal_text, const model::PluginDescriptor& descriptor, const SuggestionContext& context) const override;

 private:
  Fn fn_;
};

// Lowercased alphanumeric words, e.g. "data/raw Files" -> {"data", "raw", "files"}.
std::vector<std::string> Tokenize(const std::string& text);

} // namespace chainweave::suggestion
