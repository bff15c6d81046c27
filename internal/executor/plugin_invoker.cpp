#include "internal/executor/plugin_invoker.hpp"

#include <exception>
#include <future>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace chainweave::executor {

namespace {

model::ErrorInfo ErrorFrom(std::string_view code, std::string message) {
  return model::ErrorInfo{std::string(code), std::move(message)};
}

// Unwraps an exception captured from the plugin call.
model::ErrorInfo Classify(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const util::PluginError& e) {
    return ErrorFrom(e.code().empty() ? model::error_code::kPluginError : std::string_view(e.code()), e.what());
  } catch (const std::exception& e) {
    return ErrorFrom(model::error_code::kException, e.what());
  } catch (...) {
    return ErrorFrom(model::error_code::kException, "non-standard exception thrown by plugin");
  }
}

} // namespace

InvocationResult InvokePlugin(std::shared_ptr<plugin::Plugin> plugin,
                              model::ValueMap                 inputs,
                              plugin::ExecutionContext        context,
                              std::chrono::milliseconds       timeout) noexcept {
  InvocationResult result;
  const auto       started = util::Now();

  if (!plugin) {
    result.error = ErrorFrom(model::error_code::kUnboundPlugin, "no plugin instance for node '" + context.node_id + "'");
    return result;
  }

  try {
    if (timeout.count() <= 0) {
      result.output = plugin->Execute(inputs, context);
      result.ok     = true;
    } else {
      // the task owns everything the call touches so it may outlive us
      auto task = std::make_shared<std::packaged_task<model::ValueMap()>>(
          [plugin, inputs = std::move(inputs), context]() { return plugin->Execute(inputs, context); });
      auto future = task->get_future();
      std::thread([task]() { (*task)(); }).detach();

      if (future.wait_for(timeout) == std::future_status::ready) {
        result.output = future.get();
        result.ok     = true;
      } else {
        result.error = ErrorFrom(model::error_code::kTimeout,
                                 "node '" + context.node_id + "' exceeded " + std::to_string(timeout.count()) + "ms");
      }
    }
  } catch (...) {
    result.error = Classify(std::current_exception());
  }

  result.duration_ms = util::ElapsedMillis(started, util::Now());
  return result;
}

} // namespace chainweave::executor
