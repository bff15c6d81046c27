#include "internal/chain/chain_validator.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using chainweave::model::Chain;
using chainweave::model::ChainEdge;
using chainweave::model::ChainNode;
using chainweave::model::PluginDescriptor;

ChainNode Node(const std::string& id, std::map<std::string, std::string> inputs = {}) {
  ChainNode node;
  node.id              = id;
  node.plugin_name     = id;
  node.resolved_inputs = std::move(inputs);
  return node;
}

// Source -> Transform -> Analyze, assembled by hand
Chain HandBuilt() {
  Chain chain;
  chain.goal.required_output_tag = "report";
  chain.nodes                    = {Node("Source"), Node("Transform", {{"data/raw", "Source"}}), Node("Analyze", {{"data/clean", "Transform"}})};
  chain.edges                    = {ChainEdge{"Source", "Transform", "data/raw"}, ChainEdge{"Transform", "Analyze", "data/clean"}};
  chain.goal_node_id             = "Analyze";
  return chain;
}

std::vector<PluginDescriptor> Descriptors() {
  PluginDescriptor source;
  source.name         = "Source";
  source.output_types = {"data/raw"};
  PluginDescriptor transform;
  transform.name         = "Transform";
  transform.input_types  = {"data/raw"};
  transform.output_types = {"data/clean"};
  PluginDescriptor analyze;
  analyze.name         = "Analyze";
  analyze.input_types  = {"data/clean"};
  analyze.output_types = {"report"};
  return {source, transform, analyze};
}

void TestHandBuiltChainIsValid() {
  auto chain = HandBuilt();
  chainweave::chain::ValidateChain(chain);
  chainweave::chain::ValidateChain(chain, Descriptors());
}

void TestTwoProducersForOneInputIsAmbiguous() {
  auto chain = HandBuilt();
  chain.nodes.insert(chain.nodes.begin(), Node("Other"));
  chain.edges.push_back(ChainEdge{"Other", "Transform", "data/raw"});

  bool threw = false;
  try {
    chainweave::chain::ValidateChain(chain);
  } catch (const chainweave::util::AmbiguousFanIn& e) {
    threw = e.consumer() == "Transform" && e.tag() == "data/raw";
  }
  assert(threw);
}

void TestSeededInputWithProducerIsAmbiguous() {
  auto chain = HandBuilt();
  chain.nodes[1].seed_inputs.insert("data/raw");

  bool threw = false;
  try {
    chainweave::chain::ValidateChain(chain);
  } catch (const chainweave::util::AmbiguousFanIn&) {
    threw = true;
  }
  assert(threw);
}

void TestCycleInHandBuiltChain() {
  Chain chain;
  chain.goal.required_output_tag = "a";
  chain.nodes                    = {Node("A", {{"b", "B"}}), Node("B", {{"a", "A"}})};
  chain.edges                    = {ChainEdge{"B", "A", "b"}, ChainEdge{"A", "B", "a"}};
  chain.goal_node_id             = "A";

  bool threw = false;
  try {
    chainweave::chain::ValidateChain(chain);
  } catch (const chainweave::util::CyclicDependency& e) {
    threw = e.path().size() == 2;
  }
  assert(threw);
}

void TestEdgeTagMustMatchDeclaredTypes() {
  auto chain              = HandBuilt();
  chain.edges[0].tag      = "data/other";
  chain.nodes[1].resolved_inputs = {{"data/other", "Source"}};

  // structurally consistent
  chainweave::chain::ValidateChain(chain);

  bool threw = false;
  try {
    chainweave::chain::ValidateChain(chain, Descriptors());
  } catch (const chainweave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNodesMustBeInTopologicalOrder() {
  auto chain = HandBuilt();
  std::swap(chain.nodes[0], chain.nodes[2]);

  bool threw = false;
  try {
    chainweave::chain::ValidateChain(chain);
  } catch (const chainweave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto order = chainweave::chain::TopologicalOrder(chain.nodes, chain.edges);
  assert(order == (std::vector<std::string>{"Source", "Transform", "Analyze"}));
}

void TestEdgeWithoutResolvedInputIsRejected() {
  auto chain = HandBuilt();
  chain.nodes[2].resolved_inputs.clear();

  bool threw = false;
  try {
    chainweave::chain::ValidateChain(chain);
  } catch (const chainweave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestHandBuiltChainIsValid();
  TestTwoProducersForOneInputIsAmbiguous();
  TestSeededInputWithProducerIsAmbiguous();
  TestCycleInHandBuiltChain();
  TestEdgeTagMustMatchDeclaredTypes();
  TestNodesMustBeInTopologicalOrder();
  TestEdgeWithoutResolvedInputIsRejected();

  std::cout << "chain_validator_test: pass\n";
  return 0;
}
