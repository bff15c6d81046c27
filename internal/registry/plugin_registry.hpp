#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/model/plugin_descriptor.hpp"
#include "internal/plugin/plugin.hpp"

namespace chainweave::registry {

/*
  Holds plugin capability descriptors and, optionally, the plugin instance
  bound to each of them.

  Every read returns a copy so callers never observe a registration that
  happens while they iterate.
*/
class PluginRegistry {
 public:
  using Filter = std::function<bool(const model::PluginDescriptor&)>;

  // Throws util::DuplicateName if the name is taken, util::InvalidArgument
  // if the descriptor is malformed or disagrees with the instance io spec.
  void Register(model::PluginDescriptor descriptor, std::shared_ptr<plugin::Plugin> instance = nullptr);

  // Returns false when the name was not registered.
  bool Unregister(const std::string& name);

  // Snapshot ordered by name.
  std::vector<model::PluginDescriptor> List(const Filter& filter = {}) const;

  std::optional<model::PluginDescriptor> Get(const std::string& name) const;

  // nullptr when unknown or registered without an instance
  std::shared_ptr<plugin::Plugin> ResolvePlugin(const std::string& name) const;

  // All producers of tag, ranked by RankProducers.
  std::vector<model::PluginDescriptor> FindProducers(const model::TypeTag& tag, const std::set<std::string>& selected = {}) const;

  std::size_t Size() const;

 private:
  struct Entry {
    model::PluginDescriptor         descriptor;
    std::shared_ptr<plugin::Plugin> instance;
  };

  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> entries_;
};

/*
  Deterministic producer ordering:

    1. descriptors whose collaborates_with names a plugin in `selected`
    2. chain_priority descending
    3. name ascending
*/
std::vector<model::PluginDescriptor> RankProducers(std::vector<model::PluginDescriptor> producers, const std::set<std::string>& selected);

} // namespace chainweave::registry
