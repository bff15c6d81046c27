#include "internal/chain/chain_builder.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>

#include "internal/chain/chain_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/plugin_registry.hpp"
#include "internal/util/errors.hpp"

namespace chainweave::chain {

using chainweave::model::Chain;
using chainweave::model::ChainEdge;
using chainweave::model::ChainGoal;
using chainweave::model::ChainNode;
using chainweave::model::PluginDescriptor;
using chainweave::model::TypeTag;

namespace {

/*
  Depth-first backward resolution.

  resolved_ memoizes tag -> producer node so every consumer of a tag shares
  one producer. path_ holds the tags currently being resolved; meeting one
  of them again is a cycle.
*/
class Resolver {
 public:
  Resolver(const ChainGoal& goal, const std::vector<PluginDescriptor>& candidates) : goal_(goal), candidates_(candidates) {
  }

  std::string Resolve(const TypeTag& tag) {
    if (auto it = resolved_.find(tag); it != resolved_.end()) {
      return it->second;
    }
    if (std::find(path_.begin(), path_.end(), tag) != path_.end()) {
      ThrowCycle(tag);
    }

    const auto& producer = SelectProducer(tag);

    if (in_progress_.count(producer.name) > 0) {
      ThrowCycle(tag);
    }
    if (nodes_.count(producer.name) > 0) {
      resolved_[tag] = producer.name;
      return producer.name;
    }

    path_.push_back(tag);
    in_progress_.insert(producer.name);
    selected_.insert(producer.name);

    ChainNode node;
    node.id          = producer.name;
    node.plugin_name = producer.name;

    for (const auto& input : producer.input_types) {
      if (goal_.seed_inputs.count(input) > 0) {
        node.seed_inputs.insert(input);
        continue;
      }
      auto upstream                = Resolve(input);
      node.resolved_inputs[input] = upstream;
      edges_.push_back(ChainEdge{upstream, node.id, input});
    }

    in_progress_.erase(producer.name);
    path_.pop_back();

    const auto id = node.id;
    nodes_.emplace(id, std::move(node));
    resolved_[tag] = id;
    return id;
  }

  std::vector<ChainNode> TakeNodes() {
    std::vector<ChainNode> nodes;
    nodes.reserve(nodes_.size());
    for (auto& [_, node] : nodes_) {
      nodes.push_back(std::move(node));
    }
    return nodes;
  }

  std::vector<ChainEdge> TakeEdges() {
    return std::move(edges_);
  }

 private:
  // auto_chain = false producers only qualify as the sole producer of a tag
  const PluginDescriptor& SelectProducer(const TypeTag& tag) {
    std::vector<PluginDescriptor> automatic;
    std::vector<PluginDescriptor> manual;
    for (const auto& candidate : candidates_) {
      if (!candidate.Produces(tag)) continue;
      (candidate.auto_chain ? automatic : manual).push_back(candidate);
    }

    std::vector<PluginDescriptor> eligible;
    if (!automatic.empty()) {
      eligible = std::move(automatic);
    } else if (manual.size() == 1) {
      eligible = std::move(manual);
    } else {
      throw util::NoViableChain(tag);
    }

    const auto ranked = registry::RankProducers(std::move(eligible), selected_);
    for (const auto& candidate : candidates_) {
      if (candidate.name == ranked.front().name) return candidate;
    }
    throw util::NoViableChain(tag);
  }

  [[noreturn]] void ThrowCycle(const TypeTag& tag) const {
    auto cycle = path_;
    cycle.push_back(tag);
    throw util::CyclicDependency(tag, std::move(cycle));
  }

  const ChainGoal&                     goal_;
  const std::vector<PluginDescriptor>& candidates_;

  std::map<TypeTag, std::string>   resolved_;
  std::map<std::string, ChainNode> nodes_;
  std::set<std::string>            selected_;
  std::set<std::string>            in_progress_;
  std::vector<TypeTag>             path_;
  std::vector<ChainEdge>           edges_;
};

void CheckCandidates(const std::vector<PluginDescriptor>& candidates) {
  std::set<std::string> names;
  for (const auto& candidate : candidates) {
    model::ValidateDescriptor(candidate);
    if (!names.insert(candidate.name).second) {
      throw util::InvalidArgument("candidate plugin '" + candidate.name + "' listed twice");
    }
  }
}

} // namespace

Chain BuildChain(const ChainGoal& goal, const std::vector<PluginDescriptor>& candidates) {
  if (goal.required_output_tag.empty()) {
    throw util::InvalidArgument("goal requires an output tag");
  }
  CheckCandidates(candidates);

  Resolver resolver(goal, candidates);
  const auto goal_node_id = resolver.Resolve(goal.required_output_tag);

  auto nodes = resolver.TakeNodes();
  auto edges = resolver.TakeEdges();

  std::map<std::string, std::size_t> rank;
  const auto                         order = TopologicalOrder(nodes, edges);
  for (std::size_t i = 0; i < order.size(); ++i) {
    rank[order[i]] = i;
  }

  std::sort(nodes.begin(), nodes.end(), [&rank](const ChainNode& a, const ChainNode& b) { return rank[a.id] < rank[b.id]; });
  std::sort(edges.begin(), edges.end(), [&rank](const ChainEdge& a, const ChainEdge& b) {
    if (rank[a.consumer_node_id] != rank[b.consumer_node_id]) return rank[a.consumer_node_id] < rank[b.consumer_node_id];
    return a.tag < b.tag;
  });

  Chain chain;
  chain.goal         = goal;
  chain.nodes        = std::move(nodes);
  chain.edges        = std::move(edges);
  chain.goal_node_id = goal_node_id;
  chain.fingerprint  = model::ComputeFingerprint(chain);

  ValidateChain(chain, candidates);

  CHAINWEAVE_LOG_DEBUG("Built chain", {observability::StringField("goal", goal.required_output_tag),
                                       observability::IntField("nodes", static_cast<std::int64_t>(chain.nodes.size())),
                                       observability::StringField("fingerprint", chain.fingerprint)});
  return chain;
}

ChainBuilder::ChainBuilder(std::shared_ptr<const registry::PluginRegistry> registry) : registry_(std::move(registry)) {
  if (!registry_) {
    throw util::InvalidArgument("chain builder requires a plugin registry");
  }
}

Chain ChainBuilder::Build(const ChainGoal& goal) const {
  return BuildChain(goal, registry_->List());
}

Chain ChainBuilder::Build(const ChainGoal& goal, const std::vector<PluginDescriptor>& candidates) const {
  return BuildChain(goal, candidates);
}

} // namespace chainweave::chain
