#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "internal/model/cancellation.hpp"
#include "internal/model/value.hpp"

namespace chainweave::plugin {

struct IoSpec {
  model::TagSet inputs;
  model::TagSet outputs;
};

/*
  Per-invocation context handed to a plugin.

  Long running plugins should poll CancellationRequested() and return
  early; the executor never interrupts them.
*/
struct ExecutionContext {
  std::string run_id;
  std::string node_id;

  std::shared_ptr<const model::CancellationToken> cancellation;

  std::map<std::string, std::string> attributes;

  bool CancellationRequested() const {
    return cancellation && cancellation->IsCancelled();
  }
};

/*
  Execution contract implemented by every plugin.

  Execute receives one value per declared input tag and returns one value
  per produced output tag. Failures are reported by throwing
  util::PluginError; any other exception is treated the same way.

  An instance may be invoked concurrently by different chain runs.
*/
class Plugin {
 public:
  virtual ~Plugin() = default;

  virtual IoSpec GetIoSpec() const = 0;

  virtual model::ValueMap Execute(const model::ValueMap& inputs, const ExecutionContext& context) = 0;
};

/*
  Plugin backed by a callable. Used for in-process plugins and tests.
*/
class FunctionPlugin final : public Plugin {
 public:
  using Fn = std::function<model::ValueMap(const model::ValueMap&, const ExecutionContext&)>;

  FunctionPlugin(IoSpec spec, Fn fn);

  IoSpec GetIoSpec() const override;

  model::ValueMap Execute(const model::ValueMap& inputs, const ExecutionContext& context) override;

 private:
  IoSpec spec_;
  Fn     fn_;
};

std::shared_ptr<Plugin> MakeFunctionPlugin(IoSpec spec, FunctionPlugin::Fn fn);

} // namespace chainweave::plugin
