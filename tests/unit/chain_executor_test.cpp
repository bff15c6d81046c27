#include "internal/executor/chain_executor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/chain/chain_builder.hpp"
#include "internal/executor/performance_tracker.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/registry/plugin_registry.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using chainweave::executor::ChainExecutor;
using chainweave::executor::RunOptions;
using chainweave::model::ChainGoal;
using chainweave::model::ExecutionMode;
using chainweave::model::NodeStatus;
using chainweave::model::RunStatus;
using chainweave::model::TagSet;
using chainweave::model::ValueMap;
using chainweave::plugin::ExecutionContext;
using chainweave::plugin::FunctionPlugin;
using chainweave::registry::PluginRegistry;

namespace error_code = chainweave::model::error_code;

std::string Text(const ValueMap& values, const std::string& tag) {
  return chainweave::model::ValueToString(values.at(tag));
}

// Plugin writing "<name>(<inputs>)" on each output tag.
FunctionPlugin::Fn Wrap(const std::string& name) {
  return [name](const ValueMap& inputs, const ExecutionContext&) {
    std::string joined;
    for (const auto& [tag, value] : inputs) {
      if (!joined.empty()) joined += ",";
      joined += chainweave::model::ValueToString(value);
    }
    return ValueMap{{"__out", chainweave::model::StringValue(name + "(" + joined + ")")}};
  };
}

void Add(PluginRegistry& registry, const std::string& name, TagSet inputs, TagSet outputs, FunctionPlugin::Fn fn = {}) {
  chainweave::model::PluginDescriptor d;
  d.name         = name;
  d.input_types  = inputs;
  d.output_types = outputs;

  if (!fn) fn = Wrap(name);
  // route the "__out" convenience key onto every declared output
  auto routed = [fn, outputs](const ValueMap& in, const ExecutionContext& ctx) {
    auto     raw = fn(in, ctx);
    ValueMap out;
    for (auto& [tag, value] : raw) {
      if (tag == "__out") {
        for (const auto& o : outputs) out[o] = value;
      } else {
        out[tag] = value;
      }
    }
    return out;
  };
  registry.Register(d, chainweave::plugin::MakeFunctionPlugin({inputs, outputs}, routed));
}

chainweave::model::Chain Build(const std::shared_ptr<PluginRegistry>& registry, const std::string& tag, TagSet seeds = {}) {
  ChainGoal goal;
  goal.required_output_tag = tag;
  goal.seed_inputs         = std::move(seeds);
  return chainweave::chain::ChainBuilder(registry).Build(goal);
}

std::shared_ptr<PluginRegistry> PipelineRegistry(FunctionPlugin::Fn transform = {}) {
  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "Source", {}, {"data/raw"});
  Add(*registry, "Transform", {"data/raw"}, {"data/clean"}, std::move(transform));
  Add(*registry, "Analyze", {"data/clean"}, {"report"});
  return registry;
}

FunctionPlugin::Fn Failing(const std::string& message) {
  return [message](const ValueMap&, const ExecutionContext&) -> ValueMap { throw chainweave::util::PluginError("boom", message); };
}

std::shared_ptr<chainweave::executor::WorkerPool> StartedPool(std::size_t threads) {
  auto pool = std::make_shared<chainweave::executor::WorkerPool>(threads);
  pool->Start();
  return pool;
}

void TestSequentialPipelineSucceeds() {
  auto registry = PipelineRegistry();
  auto store    = std::make_shared<chainweave::state::StateStore>();
  auto perf     = std::make_shared<chainweave::executor::PerformanceTracker>();
  auto chain    = Build(registry, "report");

  ChainExecutor executor(registry, store, nullptr, perf);
  auto          run = executor.RunChain(chain, ExecutionMode::kSequential);

  assert(run.status == RunStatus::kSucceeded);
  assert(Text(run.node_states.at("Analyze").output, "report") == "Analyze(Transform(Source()))");
  assert(chainweave::executor::GoalOutput(run).has_value());
  assert(run.Progress() == 1.0);
  assert(run.started_at <= run.ended_at);
  for (const auto& [_, state] : run.node_states) {
    assert(state.status == NodeStatus::kSucceeded);
    assert(state.started_at <= state.ended_at);
  }

  auto stored = store->Get(run.run_id);
  assert(stored.status == RunStatus::kSucceeded);
  assert(store->ListActive().empty());

  assert(perf->Stats("Transform")->count == 1);
  chainweave::executor::RequireSuccess(run);
}

void TestFailureSkipsDependents() {
  auto registry = PipelineRegistry(Failing("transform exploded"));
  auto chain    = Build(registry, "report");

  ChainExecutor executor(registry);
  auto          run = executor.RunChain(chain, ExecutionMode::kSequential);

  assert(run.status == RunStatus::kPartialFailure);
  assert(run.node_states.at("Source").status == NodeStatus::kSucceeded);
  assert(run.node_states.at("Transform").status == NodeStatus::kFailed);
  assert(run.node_states.at("Transform").error->code == "boom");
  assert(run.node_states.at("Transform").error->message == "transform exploded");
  assert(run.node_states.at("Analyze").status == NodeStatus::kSkipped);
  assert(run.node_states.at("Analyze").error->code == error_code::kDependencyFailed);
  assert(!run.aborted);

  bool threw = false;
  try {
    chainweave::executor::RequireSuccess(run);
  } catch (const chainweave::util::PluginExecutionError& e) {
    threw = e.node_id() == "Transform" && e.code() == "boom";
  }
  assert(threw);
}

// Left fails; Right is independent and still runs.
std::shared_ptr<PluginRegistry> BranchRegistry() {
  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "Left", {}, {"left"}, Failing("left broke"));
  Add(*registry, "Right", {}, {"right"});
  Add(*registry, "Merge", {"left", "right"}, {"merged"});
  return registry;
}

void TestIndependentBranchContinues() {
  auto registry = BranchRegistry();
  auto chain    = Build(registry, "merged");

  for (auto mode : {ExecutionMode::kSequential, ExecutionMode::kParallel, ExecutionMode::kAdaptive}) {
    ChainExecutor executor(registry, nullptr, StartedPool(2));
    auto          run = executor.RunChain(chain, mode);

    assert(run.node_states.at("Left").status == NodeStatus::kFailed);
    assert(run.node_states.at("Right").status == NodeStatus::kSucceeded);
    assert(run.node_states.at("Merge").status == NodeStatus::kSkipped);
    assert(run.status == RunStatus::kPartialFailure);
  }
}

void TestFailFastAbortsChain() {
  auto registry = BranchRegistry();
  auto chain    = Build(registry, "merged");

  RunOptions options;
  options.fail_fast = true;

  ChainExecutor executor(registry);
  auto          run = executor.RunChain(chain, ExecutionMode::kSequential, options);

  // canonical order is Left, Right, Merge
  assert(run.aborted);
  assert(run.error->code == error_code::kChainAborted);
  assert(run.node_states.at("Left").status == NodeStatus::kFailed);
  assert(run.node_states.at("Right").status == NodeStatus::kSkipped);
  assert(run.node_states.at("Right").error->code == error_code::kChainAborted);
  assert(run.node_states.at("Merge").status == NodeStatus::kSkipped);
  assert(run.status == RunStatus::kFailed);

  bool threw = false;
  try {
    chainweave::executor::RequireSuccess(run);
  } catch (const chainweave::util::ChainAborted&) {
    threw = true;
  }
  assert(threw);
}

// Source -> {A, B, C} -> Merge, every node deterministic
std::shared_ptr<PluginRegistry> FanRegistry() {
  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "Source", {}, {"raw"});
  Add(*registry, "A", {"raw"}, {"a"});
  Add(*registry, "B", {"raw"}, {"b"});
  Add(*registry, "C", {"raw"}, {"c"});
  Add(*registry, "Merge", {"a", "b", "c"}, {"merged"});
  return registry;
}

void TestModesProduceIdenticalStates() {
  auto registry = FanRegistry();
  auto chain    = Build(registry, "merged");

  ChainExecutor sequential(registry);
  auto          reference = sequential.RunChain(chain, ExecutionMode::kSequential);
  assert(reference.status == RunStatus::kSucceeded);
  assert(Text(reference.node_states.at("Merge").output, "merged") == "Merge(A(Source()),B(Source()),C(Source()))");

  ChainExecutor threaded(registry, nullptr, StartedPool(3));
  for (auto mode : {ExecutionMode::kParallel, ExecutionMode::kAdaptive}) {
    for (bool inline_dispatch : {false, true}) {
      RunOptions options;
      options.inline_dispatch = inline_dispatch;
      auto run                = threaded.RunChain(chain, mode, options);

      assert(run.status == reference.status);
      for (const auto& [node_id, state] : reference.node_states) {
        const auto& other = run.node_states.at(node_id);
        assert(other.status == state.status);
        assert(chainweave::model::ValueMapsEqual(other.output, state.output));
      }
    }
  }
}

void TestParallelRunsReadyNodesConcurrently() {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  auto slow = [&running, &peak](const ValueMap&, const ExecutionContext&) {
    int now = ++running;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    --running;
    return ValueMap{{"__out", chainweave::model::StringValue("x")}};
  };

  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "A", {}, {"a"}, slow);
  Add(*registry, "B", {}, {"b"}, slow);
  Add(*registry, "C", {}, {"c"}, slow);
  Add(*registry, "Merge", {"a", "b", "c"}, {"merged"});
  auto chain = Build(registry, "merged");

  ChainExecutor executor(registry, nullptr, StartedPool(3));
  auto          run = executor.RunChain(chain, ExecutionMode::kParallel);
  assert(run.status == RunStatus::kSucceeded);
  assert(peak.load() >= 2);

  // sequential never overlaps
  peak = 0;
  run  = executor.RunChain(chain, ExecutionMode::kSequential);
  assert(run.status == RunStatus::kSucceeded);
  assert(peak.load() == 1);
}

void TestAdaptiveThresholdControlsWaves() {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  auto slow = [&running, &peak](const ValueMap&, const ExecutionContext&) {
    int now = ++running;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    --running;
    return ValueMap{{"__out", chainweave::model::StringValue("x")}};
  };

  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "A", {}, {"a"}, slow);
  Add(*registry, "B", {}, {"b"}, slow);
  Add(*registry, "Merge", {"a", "b"}, {"merged"});
  auto chain = Build(registry, "merged");

  ChainExecutor executor(registry, nullptr, StartedPool(2));

  RunOptions options;
  options.adaptive_parallel_threshold = 3;
  auto run = executor.RunChain(chain, ExecutionMode::kAdaptive, options);
  assert(run.status == RunStatus::kSucceeded);
  assert(peak.load() == 1);

  peak                                = 0;
  options.adaptive_parallel_threshold = 2;
  run                                 = executor.RunChain(chain, ExecutionMode::kAdaptive, options);
  assert(run.status == RunStatus::kSucceeded);
  assert(peak.load() == 2);
}

void TestTimeoutFailsNode() {
  auto slow = [](const ValueMap&, const ExecutionContext& ctx) {
    for (int i = 0; i < 100 && !ctx.CancellationRequested(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return ValueMap{{"__out", chainweave::model::StringValue("late")}};
  };
  auto registry = PipelineRegistry(slow);
  auto chain    = Build(registry, "report");

  RunOptions options;
  options.per_node_timeout = std::chrono::milliseconds(50);

  ChainExecutor executor(registry, nullptr, StartedPool(2));
  for (auto mode : {ExecutionMode::kSequential, ExecutionMode::kParallel}) {
    auto run = executor.RunChain(chain, mode, options);
    assert(run.node_states.at("Transform").status == NodeStatus::kFailed);
    assert(run.node_states.at("Transform").error->code == error_code::kTimeout);
    assert(run.node_states.at("Analyze").status == NodeStatus::kSkipped);
    assert(run.status == RunStatus::kPartialFailure);
  }
}

void TestCancellationStopsNewStarts() {
  auto token    = std::make_shared<chainweave::model::CancellationToken>();
  auto registry = PipelineRegistry([token](const ValueMap& in, const ExecutionContext&) {
    token->Cancel();
    return ValueMap{{"__out", chainweave::model::StringValue("cleaned " + chainweave::model::ValueToString(in.at("data/raw")))}};
  });
  auto chain = Build(registry, "report");
  auto store = std::make_shared<chainweave::state::StateStore>();

  RunOptions options;
  options.cancellation = token;

  ChainExecutor executor(registry, store, StartedPool(2));
  auto          run = executor.RunChain(chain, ExecutionMode::kParallel, options);

  // the running node finished and kept its result
  assert(run.node_states.at("Transform").status == NodeStatus::kSucceeded);
  assert(run.node_states.at("Analyze").status == NodeStatus::kSkipped);
  assert(run.node_states.at("Analyze").error->code == error_code::kCancelled);
  assert(run.node_states.at("Analyze").started_at == chainweave::util::TimePoint{});
  assert(run.status == RunStatus::kCancelled);
  assert(!executor.Cancel(run.run_id));
}

// A cancels the run while its sibling B is still waiting in the same wave.
std::shared_ptr<PluginRegistry> CancellingFanIn(const std::shared_ptr<chainweave::model::CancellationToken>& token) {
  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "A", {}, {"a"}, [token](const ValueMap&, const ExecutionContext&) {
    token->Cancel();
    return ValueMap{{"__out", chainweave::model::StringValue("a")}};
  });
  Add(*registry, "B", {}, {"b"});
  Add(*registry, "Merge", {"a", "b"}, {"merged"});
  return registry;
}

void TestCancellationInsideWaveSkipsSiblings() {
  auto token    = std::make_shared<chainweave::model::CancellationToken>();
  auto registry = CancellingFanIn(token);
  auto chain    = Build(registry, "merged");
  assert(chain.nodes[0].id == "A");

  RunOptions options;
  options.cancellation = token;

  ChainExecutor executor(registry);
  auto          run = executor.RunChain(chain, ExecutionMode::kParallel, options);

  assert(run.node_states.at("A").status == NodeStatus::kSucceeded);
  assert(run.node_states.at("B").status == NodeStatus::kSkipped);
  assert(run.node_states.at("B").error->code == error_code::kCancelled);
  assert(run.node_states.at("B").started_at == chainweave::util::TimePoint{});
  assert(run.node_states.at("Merge").status == NodeStatus::kSkipped);
  assert(run.status == RunStatus::kCancelled);
}

void TestCancellationInsideWaveWithPool() {
  auto pool = StartedPool(2);
  for (int i = 0; i < 50; ++i) {
    auto token    = std::make_shared<chainweave::model::CancellationToken>();
    auto registry = CancellingFanIn(token);

    RunOptions options;
    options.cancellation = token;

    ChainExecutor executor(registry, nullptr, pool);
    auto          run = executor.RunChain(Build(registry, "merged"), ExecutionMode::kParallel, options);

    assert(run.status == RunStatus::kCancelled);
    assert(run.node_states.at("A").status == NodeStatus::kSucceeded);
    assert(run.node_states.at("Merge").status == NodeStatus::kSkipped);
    assert(run.node_states.at("Merge").started_at == chainweave::util::TimePoint{});
    const auto& b = run.node_states.at("B");
    assert(b.status == NodeStatus::kSucceeded || (b.status == NodeStatus::kSkipped && b.error->code == error_code::kCancelled));
  }
}

// Completions pushed by workers must stay valid while RunChain returns.
void TestManyShortRunsOnSharedPool() {
  auto registry = std::make_shared<PluginRegistry>();
  Add(*registry, "Source", {}, {"data/raw"});
  auto chain = Build(registry, "data/raw");

  auto          pool = StartedPool(2);
  ChainExecutor executor(registry, nullptr, pool);
  for (int i = 0; i < 3000; ++i) {
    auto run = executor.RunChain(chain, ExecutionMode::kParallel);
    assert(run.status == RunStatus::kSucceeded);
  }
  pool->Stop();
}

void TestRunIdReusedAfterCleanup() {
  auto registry = PipelineRegistry();
  auto chain    = Build(registry, "report");
  auto store    = std::make_shared<chainweave::state::StateStore>();

  RunOptions options;
  options.run_id = "nightly";

  ChainExecutor executor(registry, store);
  auto          first = executor.RunChain(chain, ExecutionMode::kSequential, options);
  assert(first.status == RunStatus::kSucceeded);
  store->Cleanup("nightly");
  assert(!store->Find("nightly").has_value());

  auto second = executor.RunChain(chain, ExecutionMode::kSequential, options);
  assert(second.run_id == "nightly");
  auto stored = store->Find("nightly");
  assert(stored.has_value());
  assert(stored->status == RunStatus::kSucceeded);
  assert(stored->cancellation == second.cancellation);
}

void TestCancelledBeforeStart() {
  auto registry = PipelineRegistry();
  auto chain    = Build(registry, "report");

  RunOptions options;
  options.cancellation = std::make_shared<chainweave::model::CancellationToken>();
  options.cancellation->Cancel();

  ChainExecutor executor(registry);
  auto          run = executor.RunChain(chain, ExecutionMode::kSequential, options);
  assert(run.status == RunStatus::kCancelled);
  for (const auto& [_, state] : run.node_states) {
    assert(state.status == NodeStatus::kSkipped);
  }
}

void TestSeedValuesFeedNodes() {
  auto registry = PipelineRegistry();
  auto chain    = Build(registry, "report", {"data/raw"});
  assert(chain.nodes.size() == 2);

  ChainExecutor executor(registry);

  auto missing = executor.RunChain(chain, ExecutionMode::kSequential);
  assert(missing.node_states.at("Transform").error->code == error_code::kMissingInput);
  assert(missing.status == RunStatus::kFailed);

  RunOptions options;
  options.seed_values["data/raw"] = chainweave::model::StringValue("seed");
  auto run                        = executor.RunChain(chain, ExecutionMode::kSequential, options);
  assert(run.status == RunStatus::kSucceeded);
  assert(Text(run.node_states.at("Analyze").output, "report") == "Analyze(Transform(seed))");
}

void TestMissingOutputAndUnboundPlugin() {
  auto registry = PipelineRegistry([](const ValueMap&, const ExecutionContext&) { return ValueMap{{"wrong/tag", chainweave::model::StringValue("x")}}; });
  auto chain    = Build(registry, "report");

  ChainExecutor executor(registry);
  auto          run = executor.RunChain(chain, ExecutionMode::kSequential);
  assert(run.node_states.at("Transform").error->code == error_code::kMissingOutput);

  chainweave::model::PluginDescriptor lonely;
  lonely.name         = "Lonely";
  lonely.output_types = {"thing"};
  registry->Register(lonely);
  auto unbound = executor.RunChain(Build(registry, "thing"), ExecutionMode::kSequential);
  assert(unbound.node_states.at("Lonely").error->code == error_code::kUnboundPlugin);
  assert(unbound.status == RunStatus::kFailed);
}

void TestNonStandardExceptionIsCaptured() {
  auto registry = PipelineRegistry([](const ValueMap&, const ExecutionContext&) -> ValueMap { throw std::logic_error("bad state"); });
  auto chain    = Build(registry, "report");

  ChainExecutor executor(registry, nullptr, StartedPool(1));
  auto          run = executor.RunChain(chain, ExecutionMode::kParallel);
  assert(run.node_states.at("Transform").error->code == error_code::kException);
  assert(run.node_states.at("Transform").error->message == "bad state");
}

} // namespace

int main() {
  TestSequentialPipelineSucceeds();
  TestFailureSkipsDependents();
  TestIndependentBranchContinues();
  TestFailFastAbortsChain();
  TestModesProduceIdenticalStates();
  TestParallelRunsReadyNodesConcurrently();
  TestAdaptiveThresholdControlsWaves();
  TestTimeoutFailsNode();
  TestCancellationStopsNewStarts();
  TestCancellationInsideWaveSkipsSiblings();
  TestCancellationInsideWaveWithPool();
  TestManyShortRunsOnSharedPool();
  TestRunIdReusedAfterCleanup();
  TestCancelledBeforeStart();
  TestSeedValuesFeedNodes();
  TestMissingOutputAndUnboundPlugin();
  TestNonStandardExceptionIsCaptured();

  std::cout << "chain_executor_test: pass\n";
  return 0;
}
