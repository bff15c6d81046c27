#include "internal/suggestion/suggestion_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <set>

#include "internal/chain/chain_builder.hpp"
#include "internal/executor/performance_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/plugin_registry.hpp"
#include "internal/util/errors.hpp"

namespace chainweave::suggestion {

namespace {

struct Scored {
  model::PluginDescriptor descriptor;
  Relevance               relevance;
};

std::string FormatScore(double score) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", score);
  return buf;
}

// Candidate set in which `anchor` is the only producer of `tag`.
std::vector<model::PluginDescriptor> PinProducer(const std::vector<model::PluginDescriptor>& all,
                                                 const model::PluginDescriptor&              anchor,
                                                 const model::TypeTag&                       tag) {
  std::vector<model::PluginDescriptor> out;
  for (const auto& descriptor : all) {
    if (descriptor.name != anchor.name && descriptor.Produces(tag)) continue;
    out.push_back(descriptor);
  }
  return out;
}

} // namespace

SuggestionEngine::SuggestionEngine(std::shared_ptr<const registry::PluginRegistry>     registry,
                                   SuggestionOptions                                   options,
                                   std::shared_ptr<const executor::PerformanceTracker> performance)
    : registry_(std::move(registry)), options_(options), performance_(std::move(performance)) {
  if (!registry_) {
    throw util::InvalidArgument("suggestion engine requires a plugin registry");
  }
  if (options_.min_score < 0.0 || options_.min_score > 1.0) {
    throw util::InvalidArgument("suggestion min_score must be within [0, 1]");
  }
}

std::vector<Suggestion> SuggestionEngine::SuggestChains(const std::string& goal_text, const SuggestionContext& context) const {
  return SuggestChains(goal_text, context, TagOverlapScorer{});
}

std::vector<Suggestion> SuggestionEngine::SuggestChains(const std::string&       goal_text,
                                                        const SuggestionContext& context,
                                                        const RelevanceScorer&   scorer) const {
  const auto descriptors = registry_->List();

  std::map<std::string, Scored> scores;
  std::vector<const Scored*>    ranked;
  for (const auto& descriptor : descriptors) {
    auto relevance  = scorer.Score(goal_text, descriptor, context);
    // NaN would break the ranking order
    if (!std::isfinite(relevance.score)) relevance.score = 0.0;
    relevance.score = std::clamp(relevance.score, 0.0, 1.0);
    auto& entry     = scores[descriptor.name];
    entry           = Scored{descriptor, std::move(relevance)};
    ranked.push_back(&entry);
  }
  std::stable_sort(ranked.begin(), ranked.end(), [](const Scored* a, const Scored* b) {
    if (a->relevance.score != b->relevance.score) return a->relevance.score > b->relevance.score;
    return a->descriptor.name < b->descriptor.name;
  });

  std::vector<Suggestion> suggestions;
  std::set<std::string>   seen;

  auto consider = [&](const model::ChainGoal& goal, const std::vector<model::PluginDescriptor>& candidates, const Scored& anchor) {
    model::Chain chain;
    try {
      chain = chain::BuildChain(goal, candidates);
    } catch (const util::BuildError& e) {
      CHAINWEAVE_LOG_DEBUG("Suggestion candidate not buildable",
                           {observability::StringField("goal", goal.required_output_tag), observability::StringField("anchor", anchor.descriptor.name),
                            observability::StringField("error", e.what())});
      return;
    }
    if (!seen.insert(chain.fingerprint).second) return;

    Suggestion suggestion;
    double     total = 0.0;
    for (const auto& node : chain.nodes) {
      const auto& scored = scores.at(node.plugin_name);
      total += scored.relevance.score;
      suggestion.rationale.push_back("plugin '" + node.plugin_name + "' scored " + FormatScore(scored.relevance.score));
      for (const auto& reason : scored.relevance.reasons) {
        suggestion.rationale.push_back(node.plugin_name + ": " + reason);
      }
    }
    suggestion.confidence = chain.nodes.empty() ? 0.0 : total / static_cast<double>(chain.nodes.size());
    suggestion.rationale.push_back("produces '" + goal.required_output_tag + "'");
    for (const auto& tag : goal.seed_inputs) {
      if (context.available_tags.count(tag) == 0) {
        suggestion.rationale.push_back("requires input '" + tag + "'");
      }
    }
    if (performance_) {
      suggestion.estimated_duration_ms = performance_->EstimateMillis(chain.PluginNames());
    }
    suggestion.chain_sketch = std::move(chain);
    suggestions.push_back(std::move(suggestion));
  };

  std::size_t anchors = 0;
  for (const auto* anchor : ranked) {
    if (anchors >= options_.max_anchor_plugins) break;
    if (anchor->relevance.score <= 0.0) break;
    ++anchors;

    for (const auto& tag : anchor->descriptor.output_types) {
      const auto candidates = PinProducer(descriptors, anchor->descriptor, tag);

      model::ChainGoal sketch;
      sketch.required_output_tag = tag;
      sketch.seed_inputs         = context.available_tags;
      sketch.seed_inputs.insert(anchor->descriptor.input_types.begin(), anchor->descriptor.input_types.end());
      sketch.seed_inputs.erase(tag);
      consider(sketch, candidates, *anchor);

      model::ChainGoal full;
      full.required_output_tag = tag;
      full.seed_inputs         = context.available_tags;
      full.seed_inputs.erase(tag);
      consider(full, candidates, *anchor);
    }
  }

  std::stable_sort(suggestions.begin(), suggestions.end(), [](const Suggestion& a, const Suggestion& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.chain_sketch.nodes.size() != b.chain_sketch.nodes.size()) return a.chain_sketch.nodes.size() < b.chain_sketch.nodes.size();
    if (a.chain_sketch.goal.required_output_tag != b.chain_sketch.goal.required_output_tag) {
      return a.chain_sketch.goal.required_output_tag < b.chain_sketch.goal.required_output_tag;
    }
    return a.chain_sketch.fingerprint < b.chain_sketch.fingerprint;
  });

  suggestions.erase(std::remove_if(suggestions.begin(), suggestions.end(),
                                   [this](const Suggestion& s) { return s.confidence < options_.min_score; }),
                    suggestions.end());
  if (options_.max_results > 0 && suggestions.size() > options_.max_results) {
    suggestions.resize(options_.max_results);
  }

  CHAINWEAVE_LOG_DEBUG("Suggested chains", {observability::StringField("goal_text", goal_text),
                                            observability::IntField("results", static_cast<std::int64_t>(suggestions.size()))});
  return suggestions;
}

} // namespace chainweave::suggestion
