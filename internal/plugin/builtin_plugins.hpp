#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/model/plugin_descriptor.hpp"
#include "internal/plugin/plugin.hpp"

namespace chainweave::plugin {

/*
  Built-in plugin kinds that let a YAML file describe a working plugin
  pool for the CLI host:

    constant    emits `value` on every output tag
    join        space-joins its inputs (ordered by tag) onto every output
    uppercase   like join, upper-cased
    word_count  number of whitespace separated words across its inputs
*/

model::PluginDescriptor DescriptorFromConfig(const chainweave::runtime::config::PluginConfig& config);

// Throws util::InvalidArgument for an unknown kind.
std::shared_ptr<Plugin> MakeBuiltinPlugin(const chainweave::runtime::config::PluginConfig& config);

} // namespace chainweave::plugin
