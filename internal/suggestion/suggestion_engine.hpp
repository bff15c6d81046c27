#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/chain.hpp"
#include "internal/suggestion/relevance_scorer.hpp"

namespace chainweave::registry {
class PluginRegistry;
}

namespace chainweave::executor {
class PerformanceTracker;
}

namespace chainweave::suggestion {

struct SuggestionOptions {
  std::size_t max_results = 5;

  // suggestions below this confidence are dropped
  double min_score = 0.0;

  // how many top-scoring plugins seed candidate goals
  std::size_t max_anchor_plugins = 3;
};

struct Suggestion {
  model::Chain             chain_sketch;
  double                   confidence = 0.0;
  std::vector<std::string> rationale;

  // sum of historical average durations, zero when unknown
  double estimated_duration_ms = 0.0;
};

/*
  Proposes chains for a free-text goal without executing anything.

  Every plugin is scored, the best ones anchor candidate goals (one per
  output tag, built both as a single-step sketch and as a full chain from
  the context's available tags), and each candidate is dry-built. Results
  are ranked by mean node score, then by fewer nodes.
*/
class SuggestionEngine {
 public:
  SuggestionEngine(std::shared_ptr<const registry::PluginRegistry>   registry,
                   SuggestionOptions                                 options     = {},
                   std::shared_ptr<const executor::PerformanceTracker> performance = nullptr);

  std::vector<Suggestion> SuggestChains(const std::string& goal_text, const SuggestionContext& context, const RelevanceScorer& scorer) const;

  // TagOverlapScorer
  std::vector<Suggestion> SuggestChains(const std::string& goal_text, const SuggestionContext& context = {}) const;

  const SuggestionOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<const registry::PluginRegistry>     registry_;
  SuggestionOptions                                   options_;
  std::shared_ptr<const executor::PerformanceTracker> performance_;
};

} // namespace chainweave::suggestion
