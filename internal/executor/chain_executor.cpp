#include "internal/executor/chain_executor.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include "internal/chain/chain_validator.hpp"
#include "internal/executor/performance_tracker.hpp"
#include "internal/executor/plugin_invoker.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/plugin_registry.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace chainweave::executor {

using chainweave::model::ChainRun;
using chainweave::model::ErrorInfo;
using chainweave::model::ExecutionMode;
using chainweave::model::NodeState;
using chainweave::model::NodeStatus;
using chainweave::model::RunStatus;

namespace {

struct Completion {
  std::string      node_id;
  InvocationResult result;
  bool             invoked = false;
};

// Completions handed back from workers to the control loop.
class CompletionQueue {
 public:
  // Notifies under the lock: the control loop may destroy the queue as
  // soon as it sees the last completion.
  void Push(Completion completion) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(completion));
    cv_.notify_one();
  }

  Completion Pop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return !queue_.empty(); });
    Completion completion = std::move(queue_.front());
    queue_.pop_front();
    return completion;
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<Completion>  queue_;
};

void Transition(NodeState& state, NodeStatus to, const std::string& node_id) {
  if (!model::CanTransition(state.status, to)) {
    throw util::InvalidState("illegal node transition for '" + node_id + "': " + std::string(model::ToString(state.status)) + " -> " +
                             std::string(model::ToString(to)));
  }
  state.status = to;
}

/*
  State of one RunChain call. Only the control loop thread touches run_;
  workers communicate through completions_.
*/
class RunDriver {
 public:
  RunDriver(const registry::PluginRegistry& registry,
            state::StateStore*              store,
            WorkerPool*                     pool,
            PerformanceTracker*             performance,
            std::shared_ptr<const model::Chain> chain,
            ExecutionMode                   mode,
            const RunOptions&               options)
      : registry_(registry), store_(store), pool_(pool), performance_(performance), options_(options) {
    run_.run_id       = options.run_id.empty() ? util::GenerateRunID() : options.run_id;
    run_.chain        = std::move(chain);
    run_.mode         = mode;
    run_.cancellation = options.cancellation ? options.cancellation : std::make_shared<model::CancellationToken>();
    for (const auto& node : run_.chain->nodes) {
      run_.node_states.emplace(node.id, NodeState{});
    }
    if (!pool_) options_.inline_dispatch = true;
    if (options_.adaptive_parallel_threshold == 0) options_.adaptive_parallel_threshold = 1;
  }

  ChainRun Drive() {
    run_.status     = RunStatus::kRunning;
    run_.started_at = util::Now();
    Publish();

    CHAINWEAVE_LOG_INFO("Chain run started", {observability::StringField("run_id", run_.run_id),
                                              observability::StringField("goal", run_.chain->goal.required_output_tag),
                                              observability::StringField("mode", model::ToString(run_.mode)),
                                              observability::IntField("nodes", static_cast<std::int64_t>(run_.chain->nodes.size()))});

    while (true) {
      SkipIfCancelled();

      // the token may fire while the wave is being dispatched
      for (const auto& node_id : SelectWave()) {
        if (SkipIfCancelled()) break;
        Start(node_id);
      }

      if (in_flight_.empty()) break;

      Apply(completions_->Pop());
    }

    Finish();
    return run_;
  }

 private:
  // Pending nodes whose producers all succeeded, in chain order.
  std::vector<std::string> ReadyNodes() const {
    std::vector<std::string> ready;
    for (const auto& node : run_.chain->nodes) {
      if (run_.node_states.at(node.id).status != NodeStatus::kPending) continue;
      bool satisfied = true;
      for (const auto& [_, producer] : node.resolved_inputs) {
        if (run_.node_states.at(producer).status != NodeStatus::kSucceeded) {
          satisfied = false;
          break;
        }
      }
      if (satisfied) ready.push_back(node.id);
    }
    return ready;
  }

  std::vector<std::string> SelectWave() const {
    auto ready = ReadyNodes();
    if (ready.empty()) return ready;

    switch (run_.mode) {
      case ExecutionMode::kSequential:
        if (!in_flight_.empty()) return {};
        return {ready.front()};

      case ExecutionMode::kParallel:
        return ready;

      case ExecutionMode::kAdaptive:
        // a wave must drain before the next decision
        if (!in_flight_.empty()) return {};
        if (ready.size() >= options_.adaptive_parallel_threshold) return ready;
        return {ready.front()};
    }
    return {};
  }

  void Start(const std::string& node_id) {
    const auto* node  = run_.chain->FindNode(node_id);
    auto&       state = run_.node_states.at(node_id);

    Transition(state, NodeStatus::kRunning, node_id);
    state.started_at = util::Now();
    in_flight_.insert(node_id);
    Publish();

    model::ValueMap inputs;
    for (const auto& [tag, producer] : node->resolved_inputs) {
      const auto& output = run_.node_states.at(producer).output;
      auto        it     = output.find(tag);
      if (it == output.end()) {
        return Reject(node_id, model::error_code::kMissingInput, "producer '" + producer + "' did not supply '" + tag + "'");
      }
      inputs[tag] = it->second;
    }
    for (const auto& tag : node->seed_inputs) {
      auto it = options_.seed_values.find(tag);
      if (it == options_.seed_values.end()) {
        return Reject(node_id, model::error_code::kMissingInput, "no seed value for '" + tag + "'");
      }
      inputs[tag] = it->second;
    }

    auto plugin = registry_.ResolvePlugin(node->plugin_name);
    if (!plugin) {
      return Reject(node_id, model::error_code::kUnboundPlugin, "plugin '" + node->plugin_name + "' has no bound instance");
    }

    plugin::ExecutionContext context;
    context.run_id       = run_.run_id;
    context.node_id      = node_id;
    context.cancellation = run_.cancellation;

    auto invoke = [completions = completions_, node_id, plugin = std::move(plugin), inputs = std::move(inputs), context = std::move(context),
                   timeout = options_.per_node_timeout]() mutable {
      Completion completion;
      completion.node_id = node_id;
      completion.invoked = true;
      completion.result  = InvokePlugin(std::move(plugin), std::move(inputs), std::move(context), timeout);
      completions->Push(std::move(completion));
    };

    if (options_.inline_dispatch) {
      invoke();
      return;
    }

    try {
      pool_->Submit(std::move(invoke));
    } catch (const util::InvalidState& e) {
      Reject(node_id, model::error_code::kException, e.what());
    }
  }

  // Fails a started node without calling its plugin.
  void Reject(const std::string& node_id, std::string_view code, std::string message) {
    Completion completion;
    completion.node_id      = node_id;
    completion.result.error = ErrorInfo{std::string(code), std::move(message)};
    completions_->Push(std::move(completion));
  }

  void Apply(Completion completion) {
    const auto& node_id = completion.node_id;
    const auto* node    = run_.chain->FindNode(node_id);
    auto&       state   = run_.node_states.at(node_id);
    auto&       result  = completion.result;

    in_flight_.erase(node_id);
    state.ended_at = util::Now();

    if (result.ok) {
      if (auto missing = MissingOutput(*node, result.output)) {
        result.ok    = false;
        result.error = ErrorInfo{std::string(model::error_code::kMissingOutput), "plugin did not produce '" + *missing + "'"};
      }
    }

    if (completion.invoked && performance_) {
      performance_->Record(node->plugin_name, result.duration_ms, result.ok);
    }

    if (result.ok) {
      Transition(state, NodeStatus::kSucceeded, node_id);
      state.output = std::move(result.output);
      Publish();
      return;
    }

    Transition(state, NodeStatus::kFailed, node_id);
    state.error = result.error;

    CHAINWEAVE_LOG_WARN("Chain node failed", {observability::StringField("run_id", run_.run_id), observability::StringField("node", node_id),
                                              observability::StringField("code", result.error.code),
                                              observability::StringField("error", result.error.message)});

    if (options_.fail_fast) {
      if (!run_.aborted) {
        run_.aborted = true;
        run_.error   = ErrorInfo{std::string(model::error_code::kChainAborted),
                               "node '" + node_id + "' failed: " + result.error.message};
      }
      SkipPending(model::error_code::kChainAborted, "chain aborted after '" + node_id + "' failed");
    } else {
      for (const auto& dependent : run_.chain->TransitiveDependentsOf(node_id)) {
        auto& dependent_state = run_.node_states.at(dependent);
        if (dependent_state.status != NodeStatus::kPending) continue;
        Transition(dependent_state, NodeStatus::kSkipped, dependent);
        dependent_state.error = ErrorInfo{std::string(model::error_code::kDependencyFailed), "upstream node '" + node_id + "' failed"};
      }
    }
    Publish();
  }

  // First tag a downstream consumer (or the goal) needs but the output lacks.
  std::optional<std::string> MissingOutput(const model::ChainNode& node, const model::ValueMap& output) const {
    for (const auto& edge : run_.chain->edges) {
      if (edge.producer_node_id == node.id && output.count(edge.tag) == 0) return edge.tag;
    }
    if (node.id == run_.chain->goal_node_id && output.count(run_.chain->goal.required_output_tag) == 0) {
      return run_.chain->goal.required_output_tag;
    }
    return std::nullopt;
  }

  bool SkipIfCancelled() {
    if (!run_.cancellation->IsCancelled()) return false;
    if (SkipPending(model::error_code::kCancelled, "run cancelled before node started") > 0) {
      cancelled_ = true;
    }
    return true;
  }

  std::size_t SkipPending(std::string_view code, const std::string& message) {
    std::size_t skipped = 0;
    for (auto& [node_id, state] : run_.node_states) {
      if (state.status != NodeStatus::kPending) continue;
      Transition(state, NodeStatus::kSkipped, node_id);
      state.error = ErrorInfo{std::string(code), message};
      ++skipped;
    }
    if (skipped > 0) Publish();
    return skipped;
  }

  void Finish() {
    std::size_t succeeded = 0;
    for (const auto& [_, state] : run_.node_states) {
      if (state.status == NodeStatus::kSucceeded) ++succeeded;
    }

    if (cancelled_) {
      run_.status = RunStatus::kCancelled;
      if (!run_.error) run_.error = ErrorInfo{std::string(model::error_code::kCancelled), "run cancelled"};
    } else if (succeeded == run_.node_states.size()) {
      run_.status = RunStatus::kSucceeded;
    } else if (succeeded > 0) {
      run_.status = RunStatus::kPartialFailure;
    } else {
      run_.status = RunStatus::kFailed;
    }
    run_.ended_at = util::Now();
    Publish();

    CHAINWEAVE_LOG_INFO("Chain run finished", {observability::StringField("run_id", run_.run_id),
                                               observability::StringField("status", model::ToString(run_.status)),
                                               observability::IntField("succeeded", static_cast<std::int64_t>(succeeded)),
                                               observability::BoolField("aborted", run_.aborted),
                                               observability::DoubleField("elapsed_ms", util::ElapsedMillis(run_.started_at, run_.ended_at))});
  }

  // The first publish claims the run id and may throw util::InvalidState.
  // Later on, the id can only be lost to a new run after Cleanup, and the
  // run keeps executing without the store.
  void Publish() {
    if (!store_) return;
    if (!published_) {
      store_->Put(run_);
      published_ = true;
      return;
    }
    try {
      store_->Put(run_);
    } catch (const util::InvalidState& e) {
      CHAINWEAVE_LOG_WARN("Chain run detached from state store",
                          {observability::StringField("run_id", run_.run_id), observability::StringField("error", e.what())});
      store_ = nullptr;
    }
  }

  const registry::PluginRegistry& registry_;
  state::StateStore*              store_;
  WorkerPool*                     pool_;
  PerformanceTracker*             performance_;
  RunOptions                      options_;

  ChainRun              run_;
  std::set<std::string> in_flight_;

  // shared with submitted tasks so a late Push never outlives the queue
  std::shared_ptr<CompletionQueue> completions_ = std::make_shared<CompletionQueue>();
  bool                  cancelled_ = false;
  bool                  published_ = false;
};

} // namespace

ChainExecutor::ChainExecutor(std::shared_ptr<const registry::PluginRegistry> registry,
                             std::shared_ptr<state::StateStore>              store,
                             std::shared_ptr<WorkerPool>                     pool,
                             std::shared_ptr<PerformanceTracker>             performance)
    : registry_(std::move(registry)), store_(std::move(store)), pool_(std::move(pool)), performance_(std::move(performance)) {
  if (!registry_) {
    throw util::InvalidArgument("chain executor requires a plugin registry");
  }
}

model::ChainRun ChainExecutor::RunChain(const model::Chain& chain, model::ExecutionMode mode, const RunOptions& options) const {
  chain::ValidateChain(chain);

  RunDriver driver(*registry_, store_.get(), pool_.get(), performance_.get(), std::make_shared<const model::Chain>(chain), mode, options);
  return driver.Drive();
}

bool ChainExecutor::Cancel(const std::string& run_id) const {
  return store_ && store_->Cancel(run_id);
}

void RequireSuccess(const model::ChainRun& run) {
  if (run.status == RunStatus::kSucceeded) return;

  if (run.aborted) {
    throw util::ChainAborted(run.error ? run.error->message : "chain aborted");
  }
  if (run.chain) {
    for (const auto& node : run.chain->nodes) {
      const auto* state = run.FindNode(node.id);
      if (state && state->status == NodeStatus::kFailed) {
        const auto& error = state->error ? *state->error : ErrorInfo{std::string(model::error_code::kPluginError), "node failed"};
        throw util::PluginExecutionError(node.id, error.code, "node '" + node.id + "' failed: " + error.message);
      }
    }
  }
  throw util::ChainAborted("chain run " + run.run_id + " ended " + std::string(model::ToString(run.status)));
}

std::optional<model::Value> GoalOutput(const model::ChainRun& run) {
  if (!run.chain) return std::nullopt;
  const auto* state = run.FindNode(run.chain->goal_node_id);
  if (!state || state->status != NodeStatus::kSucceeded) return std::nullopt;
  auto it = state->output.find(run.chain->goal.required_output_tag);
  if (it == state->output.end()) return std::nullopt;
  return it->second;
}

} // namespace chainweave::executor
