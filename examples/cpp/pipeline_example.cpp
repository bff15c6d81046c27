#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>

#include "internal/chain/chain_builder.hpp"
#include "internal/executor/chain_executor.hpp"
#include "internal/executor/performance_tracker.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/registry/plugin_registry.hpp"
#include "internal/serialization/chain_codec.hpp"
#include "internal/state/state_store.hpp"
#include "internal/suggestion/suggestion_engine.hpp"

namespace {

using chainweave::model::PluginDescriptor;
using chainweave::model::ValueMap;
using chainweave::plugin::ExecutionContext;

PluginDescriptor Describe(std::string name, chainweave::model::TagSet inputs, chainweave::model::TagSet outputs, std::string description) {
  PluginDescriptor descriptor;
  descriptor.name         = std::move(name);
  descriptor.input_types  = std::move(inputs);
  descriptor.output_types = std::move(outputs);
  descriptor.description  = std::move(description);
  return descriptor;
}

} // namespace

int main() {
  auto registry = std::make_shared<chainweave::registry::PluginRegistry>();

  // In-process plugins: read a document, normalize it, then summarize it.
  registry->Register(Describe("Reader", {"source/path"}, {"text/raw"}, "reads raw text"),
                     chainweave::plugin::MakeFunctionPlugin({{"source/path"}, {"text/raw"}}, [](const ValueMap& in, const ExecutionContext&) {
                       auto path = in.at("source/path").string_value();
                       return ValueMap{{"text/raw", chainweave::model::StringValue("contents of " + path)}};
                     }));

  registry->Register(Describe("Normalizer", {"text/raw"}, {"text/clean"}, "normalizes text case"),
                     chainweave::plugin::MakeFunctionPlugin({{"text/raw"}, {"text/clean"}}, [](const ValueMap& in, const ExecutionContext&) {
                       auto text = in.at("text/raw").string_value();
                       std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                       return ValueMap{{"text/clean", chainweave::model::StringValue(text)}};
                     }));

  registry->Register(Describe("Summarizer", {"text/clean"}, {"text/summary"}, "summarizes clean text"),
                     chainweave::plugin::MakeFunctionPlugin({{"text/clean"}, {"text/summary"}}, [](const ValueMap& in, const ExecutionContext&) {
                       const auto& text = in.at("text/clean").string_value();
                       return ValueMap{{"text/summary", chainweave::model::NumberValue(static_cast<double>(text.size()))}};
                     }));

  auto pool = std::make_shared<chainweave::executor::WorkerPool>(2);
  pool->Start();

  auto store       = std::make_shared<chainweave::state::StateStore>();
  auto performance = std::make_shared<chainweave::executor::PerformanceTracker>();

  chainweave::chain::ChainBuilder     builder(registry);
  chainweave::executor::ChainExecutor executor(registry, store, pool, performance);

  chainweave::model::ChainGoal goal;
  goal.required_output_tag = "text/summary";
  goal.seed_inputs         = {"source/path"};
  const auto chain         = builder.Build(goal);

  std::cout << "chain " << chain.fingerprint << ":\n";
  for (const auto& node : chain.nodes) {
    std::cout << "  " << node.id << "\n";
  }

  chainweave::executor::RunOptions options;
  options.seed_values["source/path"] = chainweave::model::StringValue("README.md");

  const auto run = executor.RunChain(chain, chainweave::model::ExecutionMode::kAdaptive, options);
  std::cout << chainweave::serialization::ToJson(chainweave::serialization::ToProto(run), true) << "\n";

  if (auto summary = chainweave::executor::GoalOutput(run)) {
    std::cout << "summary: " << chainweave::model::ValueToString(*summary) << "\n";
  }
  store->Cleanup(run.run_id);

  chainweave::suggestion::SuggestionEngine suggestions(registry, {}, performance);
  for (const auto& suggestion : suggestions.SuggestChains("summarize text", {.available_tags = {"source/path"}})) {
    std::cout << "suggested " << suggestion.chain_sketch.goal.required_output_tag << " (confidence " << suggestion.confidence << ", ~"
              << suggestion.estimated_duration_ms << " ms)\n";
  }

  pool->Stop();
  return run.status == chainweave::model::RunStatus::kSucceeded ? 0 : 1;
}
