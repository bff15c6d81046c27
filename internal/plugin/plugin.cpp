#include "internal/plugin/plugin.hpp"

#include "internal/util/errors.hpp"

namespace chainweave::plugin {

FunctionPlugin::FunctionPlugin(IoSpec spec, Fn fn) : spec_(std::move(spec)), fn_(std::move(fn)) {
  if (!fn_) {
    throw util::InvalidArgument("function plugin requires a callable");
  }
}

IoSpec FunctionPlugin::GetIoSpec() const {
  return spec_;
}

model::ValueMap FunctionPlugin::Execute(const model::ValueMap& inputs, const ExecutionContext& context) {
  return fn_(inputs, context);
}

std::shared_ptr<Plugin> MakeFunctionPlugin(IoSpec spec, FunctionPlugin::Fn fn) {
  return std::make_shared<FunctionPlugin>(std::move(spec), std::move(fn));
}

} // namespace chainweave::plugin
