#pragma once

#include <set>
#include <string>

#include "internal/model/value.hpp"

namespace chainweave::model {

/*
  Capability record of a registered plugin.

  Immutable once registered. Matching between plugins is done purely by
  tag equality on input_types / output_types.
*/
struct PluginDescriptor {
  std::string name;

  std::string version;
  std::string description;
  std::string category;

  TagSet input_types;  // empty for source plugins
  TagSet output_types; // never empty

  // soft affinity hint, plugin names
  std::set<std::string> collaborates_with;

  // eligible for automatic inclusion in built chains
  bool auto_chain = false;

  // tie-break weight in [0,1]
  double chain_priority = 0.5;

  bool Produces(const TypeTag& tag) const {
    return output_types.count(tag) > 0;
  }

  bool Consumes(const TypeTag& tag) const {
    return input_types.count(tag) > 0;
  }

  // true when collaborates_with names any of the given plugins
  bool CollaboratesWithAny(const std::set<std::string>& plugin_names) const;
};

// Throws util::InvalidArgument when the descriptor breaks its invariants.
void ValidateDescriptor(const PluginDescriptor& descriptor);

} // namespace chainweave::model
