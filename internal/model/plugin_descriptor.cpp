#include "internal/model/plugin_descriptor.hpp"

#include "internal/util/errors.hpp"

namespace chainweave::model {

bool PluginDescriptor::CollaboratesWithAny(const std::set<std::string>& plugin_names) const {
  for (const auto& name : collaborates_with) {
    if (plugin_names.count(name) > 0) {
      return true;
    }
  }
  return false;
}

void ValidateDescriptor(const PluginDescriptor& descriptor) {
  if (descriptor.name.empty()) {
    throw util::InvalidArgument("plugin descriptor requires a name");
  }
  if (descriptor.output_types.empty()) {
    throw util::InvalidArgument("plugin '" + descriptor.name + "' declares no output types");
  }
  for (const auto& tag : descriptor.input_types) {
    if (tag.empty()) throw util::InvalidArgument("plugin '" + descriptor.name + "' declares an empty input tag");
  }
  for (const auto& tag : descriptor.output_types) {
    if (tag.empty()) throw util::InvalidArgument("plugin '" + descriptor.name + "' declares an empty output tag");
  }
  if (!(descriptor.chain_priority >= 0.0 && descriptor.chain_priority <= 1.0)) {
    throw util::InvalidArgument("plugin '" + descriptor.name + "' chain_priority must be within [0,1]");
  }
}

} // namespace chainweave::model
