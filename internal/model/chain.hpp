#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/model/value.hpp"

namespace chainweave::model {

struct ChainGoal {
  TypeTag required_output_tag;

  // tags supplied from outside the chain; no producer is searched for these
  TagSet seed_inputs;
};

/*
  One plugin invocation inside a chain.

  A plugin is instantiated at most once per chain, so the node id is the
  plugin name.
*/
struct ChainNode {
  std::string id;
  std::string plugin_name;

  // input tag -> producer node id
  std::map<TypeTag, std::string> resolved_inputs;

  // input tags satisfied by the goal's seed inputs
  TagSet seed_inputs;
};

struct ChainEdge {
  std::string producer_node_id;
  std::string consumer_node_id;
  TypeTag     tag;

  bool operator==(const ChainEdge& other) const {
    return producer_node_id == other.producer_node_id && consumer_node_id == other.consumer_node_id && tag == other.tag;
  }
};

/*
  Immutable dependency graph produced by the ChainBuilder.

  nodes are stored in canonical topological order (producers before
  consumers); this is the execution order of sequential mode.
*/
struct Chain {
  ChainGoal              goal;
  std::vector<ChainNode> nodes;
  std::vector<ChainEdge> edges;

  // node producing goal.required_output_tag
  std::string goal_node_id;

  // stable content hash, identical for identical builds
  std::string fingerprint;

  const ChainNode* FindNode(const std::string& node_id) const;

  // distinct producer node ids the node depends on, sorted
  std::vector<std::string> DependenciesOf(const std::string& node_id) const;

  // distinct consumer node ids fed by the node, sorted
  std::vector<std::string> DependentsOf(const std::string& node_id) const;

  // every node reachable downstream of node_id, excluding itself
  std::vector<std::string> TransitiveDependentsOf(const std::string& node_id) const;

  std::vector<std::string> PluginNames() const;
};

// FNV-1a over the canonical node/edge listing.
std::string ComputeFingerprint(const Chain& chain);

} // namespace chainweave::model
