#include "internal/registry/plugin_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chainweave::registry {

using chainweave::model::PluginDescriptor;

namespace {

void CheckIoSpec(const PluginDescriptor& descriptor, const plugin::Plugin& instance) {
  const auto spec = instance.GetIoSpec();
  if (spec.inputs != descriptor.input_types || spec.outputs != descriptor.output_types) {
    throw util::InvalidArgument("plugin '" + descriptor.name + "' io spec does not match its descriptor");
  }
}

} // namespace

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

void PluginRegistry::Register(PluginDescriptor descriptor, std::shared_ptr<plugin::Plugin> instance) {
  model::ValidateDescriptor(descriptor);
  if (instance) {
    CheckIoSpec(descriptor, *instance);
  }

  const auto name = descriptor.name;
  {
    std::unique_lock lock(mutex_);
    if (entries_.count(name) > 0) {
      throw util::DuplicateName("plugin '" + name + "' is already registered");
    }
    entries_.emplace(name, Entry{std::move(descriptor), std::move(instance)});
  }

  CHAINWEAVE_LOG_INFO("Registered plugin", {observability::StringField("plugin", name)});
}

bool PluginRegistry::Unregister(const std::string& name) {
  std::size_t erased = 0;
  {
    std::unique_lock lock(mutex_);
    erased = entries_.erase(name);
  }

  if (erased) {
    CHAINWEAVE_LOG_INFO("Unregistered plugin", {observability::StringField("plugin", name)});
  }
  return erased > 0;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<PluginDescriptor> PluginRegistry::List(const Filter& filter) const {
  std::shared_lock lock(mutex_);

  std::vector<PluginDescriptor> result;
  result.reserve(entries_.size());
  for (const auto& [_, entry] : entries_) {
    if (filter && !filter(entry.descriptor)) continue;
    result.push_back(entry.descriptor);
  }
  return result;
}

std::optional<PluginDescriptor> PluginRegistry::Get(const std::string& name) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(name);
  if (it == entries_.end())
    return std::nullopt;

  return it->second.descriptor;
}

std::shared_ptr<plugin::Plugin> PluginRegistry::ResolvePlugin(const std::string& name) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(name);
  if (it == entries_.end())
    return nullptr;

  return it->second.instance;
}

std::vector<PluginDescriptor> PluginRegistry::FindProducers(const model::TypeTag& tag, const std::set<std::string>& selected) const {
  return RankProducers(List([&tag](const PluginDescriptor& d) { return d.Produces(tag); }), selected);
}

std::size_t PluginRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::vector<PluginDescriptor> RankProducers(std::vector<PluginDescriptor> producers, const std::set<std::string>& selected) {
  std::stable_sort(producers.begin(), producers.end(), [&selected](const PluginDescriptor& a, const PluginDescriptor& b) {
    const bool a_match = a.CollaboratesWithAny(selected);
    const bool b_match = b.CollaboratesWithAny(selected);
    if (a_match != b_match) return a_match;
    if (a.chain_priority != b.chain_priority) return a.chain_priority > b.chain_priority;
    return a.name < b.name;
  });
  return producers;
}

} // namespace chainweave::registry
