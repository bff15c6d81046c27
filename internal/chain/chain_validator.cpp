#include "internal/chain/chain_validator.hpp"

#include <map>
#include <set>

#include "internal/util/errors.hpp"

namespace chainweave::chain {

using chainweave::model::Chain;
using chainweave::model::ChainEdge;
using chainweave::model::ChainNode;
using chainweave::model::PluginDescriptor;

std::vector<std::string> TopologicalOrder(const std::vector<ChainNode>& nodes, const std::vector<ChainEdge>& edges) {
  std::map<std::string, std::size_t>           in_degree;
  std::map<std::string, std::set<std::string>> successors;

  for (const auto& node : nodes) {
    in_degree[node.id] = 0;
  }

  // parallel edges between the same pair count once
  std::set<std::pair<std::string, std::string>> links;
  for (const auto& edge : edges) {
    if (!links.emplace(edge.producer_node_id, edge.consumer_node_id).second) continue;
    successors[edge.producer_node_id].insert(edge.consumer_node_id);
    ++in_degree[edge.consumer_node_id];
  }

  std::set<std::string> ready;
  for (const auto& [id, degree] : in_degree) {
    if (degree == 0) ready.insert(id);
  }

  std::vector<std::string> order;
  order.reserve(in_degree.size());

  while (!ready.empty()) {
    auto current = *ready.begin();
    ready.erase(ready.begin());
    order.push_back(current);

    for (const auto& next : successors[current]) {
      if (--in_degree[next] == 0) ready.insert(next);
    }
  }

  if (order.size() != in_degree.size()) {
    std::vector<std::string> remaining;
    std::string              tag;
    for (const auto& [id, degree] : in_degree) {
      if (degree > 0) remaining.push_back(id);
    }
    for (const auto& edge : edges) {
      if (in_degree[edge.consumer_node_id] > 0 && in_degree[edge.producer_node_id] > 0) {
        tag = edge.tag;
        break;
      }
    }
    throw util::CyclicDependency(tag, remaining);
  }

  return order;
}

void ValidateChain(const Chain& chain) {
  if (chain.nodes.empty()) {
    throw util::InvalidArgument("chain has no nodes");
  }

  std::map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < chain.nodes.size(); ++i) {
    const auto& node = chain.nodes[i];
    if (node.id.empty() || node.plugin_name.empty()) {
      throw util::InvalidArgument("chain node requires an id and a plugin name");
    }
    if (!position.emplace(node.id, i).second) {
      throw util::InvalidArgument("duplicate chain node id '" + node.id + "'");
    }
  }

  if (position.count(chain.goal_node_id) == 0) {
    throw util::InvalidArgument("goal node '" + chain.goal_node_id + "' is not part of the chain");
  }

  // consumer -> tag -> producers
  std::map<std::string, std::map<std::string, std::set<std::string>>> incoming;
  for (const auto& edge : chain.edges) {
    if (position.count(edge.producer_node_id) == 0 || position.count(edge.consumer_node_id) == 0) {
      throw util::InvalidArgument("edge references an unknown node");
    }
    if (edge.producer_node_id == edge.consumer_node_id) {
      throw util::CyclicDependency(edge.tag, {edge.producer_node_id});
    }
    incoming[edge.consumer_node_id][edge.tag].insert(edge.producer_node_id);
  }

  for (const auto& node : chain.nodes) {
    const auto& by_tag = incoming[node.id];

    for (const auto& [tag, producers] : by_tag) {
      if (producers.size() > 1 || node.seed_inputs.count(tag) > 0) {
        throw util::AmbiguousFanIn(node.id, tag);
      }
      auto resolved = node.resolved_inputs.find(tag);
      if (resolved == node.resolved_inputs.end() || resolved->second != *producers.begin()) {
        throw util::InvalidArgument("edge for input '" + tag + "' of node '" + node.id + "' does not match its resolved input");
      }
    }

    for (const auto& [tag, producer] : node.resolved_inputs) {
      if (by_tag.count(tag) == 0) {
        throw util::InvalidArgument("input '" + tag + "' of node '" + node.id + "' has no edge from '" + producer + "'");
      }
    }
  }

  (void)TopologicalOrder(chain.nodes, chain.edges);

  for (const auto& edge : chain.edges) {
    if (position[edge.producer_node_id] > position[edge.consumer_node_id]) {
      throw util::InvalidArgument("chain nodes are not stored in topological order");
    }
  }
}

void ValidateChain(const Chain& chain, const std::vector<PluginDescriptor>& descriptors) {
  ValidateChain(chain);

  std::map<std::string, const PluginDescriptor*> by_name;
  for (const auto& descriptor : descriptors) {
    by_name[descriptor.name] = &descriptor;
  }

  auto lookup = [&by_name](const std::string& plugin_name) -> const PluginDescriptor& {
    auto it = by_name.find(plugin_name);
    if (it == by_name.end()) {
      throw util::InvalidArgument("chain references unknown plugin '" + plugin_name + "'");
    }
    return *it->second;
  };

  std::map<std::string, std::string> plugin_of;
  for (const auto& node : chain.nodes) {
    plugin_of[node.id] = node.plugin_name;

    const auto& descriptor = lookup(node.plugin_name);
    for (const auto& tag : descriptor.input_types) {
      if (node.resolved_inputs.count(tag) == 0 && node.seed_inputs.count(tag) == 0) {
        throw util::InvalidArgument("input '" + tag + "' of node '" + node.id + "' is not satisfied");
      }
    }
    for (const auto& tag : node.seed_inputs) {
      if (!descriptor.Consumes(tag)) {
        throw util::InvalidArgument("node '" + node.id + "' is seeded with undeclared input '" + tag + "'");
      }
    }
  }

  for (const auto& edge : chain.edges) {
    const auto& producer = lookup(plugin_of[edge.producer_node_id]);
    const auto& consumer = lookup(plugin_of[edge.consumer_node_id]);
    if (!producer.Produces(edge.tag) || !consumer.Consumes(edge.tag)) {
      throw util::InvalidArgument("edge '" + edge.producer_node_id + "' -> '" + edge.consumer_node_id + "' carries mismatched tag '" + edge.tag + "'");
    }
  }

  if (!lookup(plugin_of[chain.goal_node_id]).Produces(chain.goal.required_output_tag)) {
    throw util::InvalidArgument("goal node does not produce '" + chain.goal.required_output_tag + "'");
  }
}

} // namespace chainweave::chain
