#include "internal/chain/chain_builder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>

#include "internal/registry/plugin_registry.hpp"
#include "internal/serialization/chain_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using chainweave::chain::BuildChain;
using chainweave::chain::ChainBuilder;
using chainweave::model::ChainGoal;
using chainweave::model::PluginDescriptor;
using chainweave::model::TagSet;

PluginDescriptor Describe(const std::string& name, TagSet inputs, TagSet outputs, bool auto_chain = false, double priority = 0.5) {
  PluginDescriptor d;
  d.name           = name;
  d.input_types    = std::move(inputs);
  d.output_types   = std::move(outputs);
  d.auto_chain     = auto_chain;
  d.chain_priority = priority;
  return d;
}

ChainGoal Goal(const std::string& tag, TagSet seeds = {}) {
  ChainGoal goal;
  goal.required_output_tag = tag;
  goal.seed_inputs         = std::move(seeds);
  return goal;
}

std::vector<PluginDescriptor> Pipeline() {
  return {Describe("Analyze", {"data/clean"}, {"report"}), Describe("Source", {}, {"data/raw"}),
          Describe("Transform", {"data/raw"}, {"data/clean"})};
}

void TestLinearPipelineOrder() {
  auto registry = std::make_shared<chainweave::registry::PluginRegistry>();
  for (auto& d : Pipeline()) registry->Register(d);

  ChainBuilder builder(registry);
  auto         chain = builder.Build(Goal("report"));

  assert(chain.nodes.size() == 3);
  assert(chain.nodes[0].id == "Source");
  assert(chain.nodes[1].id == "Transform");
  assert(chain.nodes[2].id == "Analyze");
  assert(chain.goal_node_id == "Analyze");
  assert(chain.edges.size() == 2);
  assert(chain.nodes[2].resolved_inputs.at("data/clean") == "Transform");

  for (const auto& edge : chain.edges) {
    const auto* producer = chain.FindNode(edge.producer_node_id);
    const auto* consumer = chain.FindNode(edge.consumer_node_id);
    assert(producer && consumer);
    assert(consumer->resolved_inputs.at(edge.tag) == producer->id);
  }
}

void TestEqualPriorityTieBreaksByName() {
  auto candidates = Pipeline();
  candidates.push_back(Describe("CleanerB", {"data/raw"}, {"data/clean"}, true));
  candidates.push_back(Describe("CleanerA", {"data/raw"}, {"data/clean"}, true));

  auto first  = BuildChain(Goal("report"), candidates);
  auto second = BuildChain(Goal("report"), candidates);

  assert(first.FindNode("CleanerA") != nullptr);
  assert(first.FindNode("CleanerB") == nullptr);
  assert(first.FindNode("Transform") == nullptr);
  assert(first.fingerprint == second.fingerprint);
  assert(chainweave::serialization::SerializeChain(first) == chainweave::serialization::SerializeChain(second));

  // candidate order does not matter
  std::reverse(candidates.begin(), candidates.end());
  auto third = BuildChain(Goal("report"), candidates);
  assert(chainweave::serialization::SerializeChain(first) == chainweave::serialization::SerializeChain(third));
}

void TestHigherPriorityWins() {
  auto candidates = Pipeline();
  candidates.push_back(Describe("CleanerA", {"data/raw"}, {"data/clean"}, true, 0.3));
  candidates.push_back(Describe("CleanerZ", {"data/raw"}, {"data/clean"}, true, 0.8));

  auto chain = BuildChain(Goal("report"), candidates);
  assert(chain.FindNode("CleanerZ") != nullptr);
}

void TestCollaborationBeatsPriority() {
  std::vector<PluginDescriptor> candidates;
  auto                          analyze = Describe("Analyze", {"data/clean"}, {"report"});
  candidates.push_back(analyze);
  candidates.push_back(Describe("Source", {}, {"data/raw"}));
  candidates.push_back(Describe("Popular", {"data/raw"}, {"data/clean"}, true, 1.0));
  auto partner = Describe("Partner", {"data/raw"}, {"data/clean"}, true, 0.1);
  partner.collaborates_with.insert("Analyze");
  candidates.push_back(partner);

  auto chain = BuildChain(Goal("report"), candidates);
  assert(chain.FindNode("Partner") != nullptr);
  assert(chain.FindNode("Popular") == nullptr);
}

void TestManualPluginOnlyAsSoleProducer() {
  // two manual producers: nothing may be picked automatically
  auto candidates = Pipeline();
  candidates.push_back(Describe("Manual", {"data/raw"}, {"data/clean"}));

  bool threw = false;
  try {
    BuildChain(Goal("report"), candidates);
  } catch (const chainweave::util::NoViableChain& e) {
    threw = e.tag() == "data/clean";
  }
  assert(threw);

  // an auto_chain producer is preferred over a manual one
  candidates.push_back(Describe("Auto", {"data/raw"}, {"data/clean"}, true, 0.0));
  auto chain = BuildChain(Goal("report"), candidates);
  assert(chain.FindNode("Auto") != nullptr);
}

void TestMissingProducer() {
  bool threw = false;
  try {
    BuildChain(Goal("report"), {Describe("Analyze", {"data/clean"}, {"report"})});
  } catch (const chainweave::util::NoViableChain& e) {
    threw = e.tag() == "data/clean";
  }
  assert(threw);

  threw = false;
  try {
    BuildChain(Goal("nothing"), Pipeline());
  } catch (const chainweave::util::BuildError& e) {
    threw = e.tag() == "nothing";
  }
  assert(threw);
}

void TestCycleIsDetected() {
  std::vector<PluginDescriptor> candidates = {Describe("A", {"b"}, {"a"}), Describe("B", {"a"}, {"b"})};

  bool threw = false;
  try {
    BuildChain(Goal("a"), candidates);
  } catch (const chainweave::util::CyclicDependency& e) {
    threw = e.tag() == "a";
    assert(e.path().front() == "a");
    assert(e.path().back() == "a");
  }
  assert(threw);

  // a plugin consuming its own output
  threw = false;
  try {
    BuildChain(Goal("out"), {Describe("Loop", {"mid"}, {"out", "mid"})});
  } catch (const chainweave::util::CyclicDependency&) {
    threw = true;
  }
  assert(threw);
}

void TestSeedInputsStopResolution() {
  auto chain = BuildChain(Goal("report", {"data/clean"}), Pipeline());
  assert(chain.nodes.size() == 1);
  assert(chain.nodes[0].id == "Analyze");
  assert(chain.nodes[0].seed_inputs.count("data/clean") == 1);
  assert(chain.edges.empty());
}

void TestSharedProducerIsReused() {
  std::vector<PluginDescriptor> candidates = {
      Describe("Source", {}, {"raw"}),
      Describe("Left", {"raw"}, {"left"}),
      Describe("Right", {"raw"}, {"right"}),
      Describe("Merge", {"left", "right"}, {"merged"}),
  };

  auto chain = BuildChain(Goal("merged"), candidates);
  assert(chain.nodes.size() == 4);
  assert(chain.nodes.front().id == "Source");
  assert(chain.nodes.back().id == "Merge");
  assert(chain.DependentsOf("Source").size() == 2);
  assert(chain.TransitiveDependentsOf("Source").size() == 3);
}

void TestDuplicateCandidatesRejected() {
  auto candidates = Pipeline();
  candidates.push_back(Describe("Source", {}, {"data/raw"}));

  bool threw = false;
  try {
    BuildChain(Goal("report"), candidates);
  } catch (const chainweave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLinearPipelineOrder();
  TestEqualPriorityTieBreaksByName();
  TestHigherPriorityWins();
  TestCollaborationBeatsPriority();
  TestManualPluginOnlyAsSoleProducer();
  TestMissingProducer();
  TestCycleIsDetected();
  TestSeedInputsStopResolution();
  TestSharedProducerIsReused();
  TestDuplicateCandidatesRejected();

  std::cout << "chain_builder_test: pass\n";
  return 0;
}
