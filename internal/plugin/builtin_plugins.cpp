#include "internal/plugin/builtin_plugins.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "internal/util/errors.hpp"

namespace chainweave::plugin {

using chainweave::runtime::config::PluginConfig;

namespace {

std::string JoinInputs(const model::ValueMap& inputs) {
  std::string joined;
  for (const auto& [_, value] : inputs) {
    auto text = model::ValueToString(value);
    if (text.empty()) continue;
    if (!joined.empty()) joined.push_back(' ');
    joined += text;
  }
  return joined;
}

model::ValueMap Broadcast(const model::TagSet& outputs, const model::Value& value) {
  model::ValueMap result;
  for (const auto& tag : outputs) {
    result[tag] = value;
  }
  return result;
}

std::size_t CountWords(const std::string& text) {
  std::istringstream in(text);
  std::size_t        count = 0;
  std::string        word;
  while (in >> word) ++count;
  return count;
}

} // namespace

model::PluginDescriptor DescriptorFromConfig(const PluginConfig& config) {
  model::PluginDescriptor descriptor;
  descriptor.name        = config.name();
  descriptor.version     = config.version();
  descriptor.description = config.description();
  descriptor.category    = config.category();
  descriptor.input_types.insert(config.input_types().begin(), config.input_types().end());
  descriptor.output_types.insert(config.output_types().begin(), config.output_types().end());
  descriptor.collaborates_with.insert(config.collaborates_with().begin(), config.collaborates_with().end());
  descriptor.auto_chain = config.auto_chain();
  if (config.has_chain_priority()) {
    descriptor.chain_priority = config.chain_priority();
  }
  return descriptor;
}

std::shared_ptr<Plugin> MakeBuiltinPlugin(const PluginConfig& config) {
  IoSpec spec;
  spec.inputs.insert(config.input_types().begin(), config.input_types().end());
  spec.outputs.insert(config.output_types().begin(), config.output_types().end());

  const auto& kind = config.kind();

  if (kind == "constant") {
    auto value = model::StringValue(config.value());
    return MakeFunctionPlugin(spec, [outputs = spec.outputs, value](const model::ValueMap&, const ExecutionContext&) {
      return Broadcast(outputs, value);
    });
  }

  if (kind == "join") {
    return MakeFunctionPlugin(spec, [outputs = spec.outputs](const model::ValueMap& inputs, const ExecutionContext&) {
      return Broadcast(outputs, model::StringValue(JoinInputs(inputs)));
    });
  }

  if (kind == "uppercase") {
    return MakeFunctionPlugin(spec, [outputs = spec.outputs](const model::ValueMap& inputs, const ExecutionContext&) {
      auto text = JoinInputs(inputs);
      std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
      return Broadcast(outputs, model::StringValue(text));
    });
  }

  if (kind == "word_count") {
    return MakeFunctionPlugin(spec, [outputs = spec.outputs](const model::ValueMap& inputs, const ExecutionContext&) {
      return Broadcast(outputs, model::NumberValue(static_cast<double>(CountWords(JoinInputs(inputs)))));
    });
  }

  throw util::InvalidArgument("plugin '" + config.name() + "' has unknown kind '" + kind + "'");
}

} // namespace chainweave::plugin
