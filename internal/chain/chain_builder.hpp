#pragma once

#include <memory>
#include <vector>

#include "internal/model/chain.hpp"
#include "internal/model/plugin_descriptor.hpp"

namespace chainweave::registry {
class PluginRegistry;
}

namespace chainweave::chain {

/*
  Turns a goal into a validated, acyclic Chain by resolving the goal's
  output tag backwards through the candidate producers.

  Failures are thrown (util::NoViableChain, util::CyclicDependency,
  util::AmbiguousFanIn); a partial chain is never returned. Building has
  no side effects, so it doubles as the dry run used for suggestions.
*/
class ChainBuilder {
 public:
  explicit ChainBuilder(std::shared_ptr<const registry::PluginRegistry> registry);

  // Uses every registered plugin as a candidate.
  model::Chain Build(const model::ChainGoal& goal) const;

  model::Chain Build(const model::ChainGoal& goal, const std::vector<model::PluginDescriptor>& candidates) const;

 private:
  std::shared_ptr<const registry::PluginRegistry> registry_;
};

// Registry independent entry point.
model::Chain BuildChain(const model::ChainGoal& goal, const std::vector<model::PluginDescriptor>& candidates);

} // namespace chainweave::chain
