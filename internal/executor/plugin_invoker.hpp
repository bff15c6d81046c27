#pragma once

#include <chrono>
#include <memory>

#include "internal/model/chain_run.hpp"
#include "internal/plugin/plugin.hpp"

namespace chainweave::executor {

struct InvocationResult {
  bool            ok = false;
  model::ValueMap output;
  model::ErrorInfo error;
  double          duration_ms = 0.0;
};

/*
  Runs one plugin call and converts every failure into an ErrorInfo.

  With a non-zero timeout the call runs on its own thread; when the
  deadline passes the result is abandoned and reported as a timeout while
  the plugin keeps running in the background until it returns. Plugins
  that honour the context's cancellation flag stop early.

  Never throws.
*/
InvocationResult InvokePlugin(std::shared_ptr<plugin::Plugin> plugin,
                              model::ValueMap                 inputs,
                              plugin::ExecutionContext        context,
                              std::chrono::milliseconds       timeout) noexcept;

} // namespace chainweave::executor
