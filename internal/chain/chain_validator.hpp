#pragma once

#include <string>
#include <vector>

#include "internal/model/chain.hpp"
#include "internal/model/plugin_descriptor.hpp"

namespace chainweave::chain {

/*
  Canonical topological order of the node ids (Kahn, ready nodes taken in
  id order). Throws util::CyclicDependency when no order exists.
*/
std::vector<std::string> TopologicalOrder(const std::vector<model::ChainNode>& nodes, const std::vector<model::ChainEdge>& edges);

/*
  Structural invariants of a chain:

    - unique node ids, goal node present
    - every edge joins existing nodes and matches the consumer's resolved input
    - each consumer input has exactly one producer (util::AmbiguousFanIn)
    - acyclic (util::CyclicDependency), nodes stored in topological order

  Other violations throw util::InvalidArgument.
*/
void ValidateChain(const model::Chain& chain);

// Additionally checks edge typing and input coverage against descriptors.
void ValidateChain(const model::Chain& chain, const std::vector<model::PluginDescriptor>& descriptors);

} // namespace chainweave::chain
