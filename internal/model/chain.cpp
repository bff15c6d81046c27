#include "internal/model/chain.hpp"

#include <cstdint>
#include <iomanip>
#include <queue>
#include <set>
#include <sstream>
#include <unordered_set>

namespace chainweave::model {

const ChainNode* Chain::FindNode(const std::string& node_id) const {
  for (const auto& node : nodes) {
    if (node.id == node_id) {
      return &node;
    }
  }
  return nullptr;
}

std::vector<std::string> Chain::DependenciesOf(const std::string& node_id) const {
  std::set<std::string> producers;
  for (const auto& edge : edges) {
    if (edge.consumer_node_id == node_id) {
      producers.insert(edge.producer_node_id);
    }
  }
  return {producers.begin(), producers.end()};
}

std::vector<std::string> Chain::DependentsOf(const std::string& node_id) const {
  std::set<std::string> consumers;
  for (const auto& edge : edges) {
    if (edge.producer_node_id == node_id) {
      consumers.insert(edge.consumer_node_id);
    }
  }
  return {consumers.begin(), consumers.end()};
}

std::vector<std::string> Chain::TransitiveDependentsOf(const std::string& node_id) const {
  std::vector<std::string> result;

  std::queue<std::string>         q;
  std::unordered_set<std::string> visited;

  q.push(node_id);
  visited.insert(node_id);

  while (!q.empty()) {
    auto current = q.front();
    q.pop();

    for (const auto& next : DependentsOf(current)) {
      if (!visited.insert(next).second)
        continue;
      result.push_back(next);
      q.push(next);
    }
  }

  return result;
}

std::vector<std::string> Chain::PluginNames() const {
  std::vector<std::string> names;
  names.reserve(nodes.size());
  for (const auto& node : nodes) {
    names.push_back(node.plugin_name);
  }
  return names;
}

std::string ComputeFingerprint(const Chain& chain) {
  std::ostringstream canonical;
  canonical << "goal=" << chain.goal.required_output_tag << ';';
  for (const auto& seed : chain.goal.seed_inputs) {
    canonical << "seed=" << seed << ';';
  }
  for (const auto& node : chain.nodes) {
    canonical << "node=" << node.id << ':' << node.plugin_name << ';';
    for (const auto& [tag, producer] : node.resolved_inputs) {
      canonical << "in=" << tag << '<' << producer << ';';
    }
    for (const auto& seed : node.seed_inputs) {
      canonical << "seed_in=" << seed << ';';
    }
  }
  for (const auto& edge : chain.edges) {
    canonical << "edge=" << edge.producer_node_id << '>' << edge.consumer_node_id << '@' << edge.tag << ';';
  }

  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : canonical.str()) {
    hash ^= c;
    hash *= 1099511628211ull;
  }

  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << hash;
  return out.str();
}

} // namespace chainweave::model
