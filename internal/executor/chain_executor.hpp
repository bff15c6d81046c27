#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/chain.hpp"
#include "internal/model/chain_run.hpp"

namespace chainweave::registry {
class PluginRegistry;
}

namespace chainweave::state {
class StateStore;
}

namespace chainweave::executor {

class WorkerPool;
class PerformanceTracker;

// Ready-set size at which adaptive mode runs a wave in parallel.
inline constexpr std::size_t kDefaultAdaptiveParallelThreshold = 2;

struct RunOptions {
  bool fail_fast = false;

  // zero disables the per-node deadline
  std::chrono::milliseconds per_node_timeout{0};

  // values for the chain goal's seed input tags
  model::ValueMap seed_values;

  // created by the executor when not supplied
  std::shared_ptr<model::CancellationToken> cancellation;

  // drive the same ready-set logic on the calling thread
  bool inline_dispatch = false;

  std::size_t adaptive_parallel_threshold = kDefaultAdaptiveParallelThreshold;

  // generated when empty; may reuse the id of a finished or cleaned up run
  std::string run_id;
};

/*
  Drives plugin invocation over a built chain.

  A node starts only after every producer it depends on SUCCEEDED. Plugin
  failures, timeouts and missing inputs end up in the node's state and are
  never thrown out of RunChain. Each state transition is published to the
  StateStore, so a run can be observed and cancelled while it executes.
*/
class ChainExecutor {
 public:
  // store, pool and performance may be null; without a pool every run
  // dispatches inline
  ChainExecutor(std::shared_ptr<const registry::PluginRegistry> registry,
                std::shared_ptr<state::StateStore>              store       = nullptr,
                std::shared_ptr<WorkerPool>                     pool        = nullptr,
                std::shared_ptr<PerformanceTracker>             performance = nullptr);

  // Throws when the chain itself is malformed, or util::InvalidState when
  // options.run_id names a run that is still active in the store.
  model::ChainRun RunChain(const model::Chain& chain, model::ExecutionMode mode, const RunOptions& options = {}) const;

  // Requests cooperative cancellation of a run in the store.
  bool Cancel(const std::string& run_id) const;

 private:
  std::shared_ptr<const registry::PluginRegistry> registry_;
  std::shared_ptr<state::StateStore>              store_;
  std::shared_ptr<WorkerPool>                     pool_;
  std::shared_ptr<PerformanceTracker>             performance_;
};

// Throws util::ChainAborted or util::PluginExecutionError unless the run
// SUCCEEDED.
void RequireSuccess(const model::ChainRun& run);

// Value of the goal tag produced by the goal node, if it succeeded.
std::optional<model::Value> GoalOutput(const model::ChainRun& run);

} // namespace chainweave::executor
