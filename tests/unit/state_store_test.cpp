#include "internal/state/state_store.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_run_archive.hpp"
#include "internal/util/errors.hpp"

namespace {

using chainweave::model::ChainRun;
using chainweave::model::NodeStatus;
using chainweave::model::RunStatus;
using chainweave::state::StateStore;

std::shared_ptr<const chainweave::model::Chain> TinyChain() {
  auto chain                        = std::make_shared<chainweave::model::Chain>();
  chain->goal.required_output_tag   = "report";
  chainweave::model::ChainNode node;
  node.id          = "Analyze";
  node.plugin_name = "Analyze";
  chain->nodes.push_back(node);
  chain->goal_node_id = "Analyze";
  chain->fingerprint  = chainweave::model::ComputeFingerprint(*chain);
  return chain;
}

ChainRun MakeRun(const std::string& id, RunStatus status) {
  ChainRun run;
  run.run_id       = id;
  run.chain        = TinyChain();
  run.status       = status;
  run.cancellation = std::make_shared<chainweave::model::CancellationToken>();
  run.started_at   = chainweave::util::Now();

  chainweave::model::NodeState state;
  state.status = chainweave::model::IsTerminal(status) ? NodeStatus::kSucceeded : NodeStatus::kRunning;
  state.started_at = run.started_at;
  if (chainweave::model::IsTerminal(status)) {
    state.ended_at = run.started_at + std::chrono::milliseconds(5);
    run.ended_at   = state.ended_at;
  }
  run.node_states["Analyze"] = state;
  return run;
}

void TestGetReturnsCopies() {
  StateStore store;
  store.Put(MakeRun("r1", RunStatus::kRunning));

  auto copy   = store.Get("r1");
  copy.status = RunStatus::kFailed;
  assert(store.Get("r1").status == RunStatus::kRunning);

  bool threw = false;
  try {
    store.Get("missing");
  } catch (const chainweave::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!store.Find("missing").has_value());
}

void TestListActiveAndCancel() {
  StateStore store;
  auto       active = MakeRun("active", RunStatus::kRunning);
  store.Put(active);
  store.Put(MakeRun("done", RunStatus::kSucceeded));

  auto listed = store.ListActive();
  assert(listed.size() == 1);
  assert(listed[0].run_id == "active");

  assert(store.Cancel("active"));
  assert(active.cancellation->IsCancelled());
  assert(!store.Cancel("done"));
  assert(!store.Cancel("missing"));
}

void TestCleanupIsIdempotent() {
  StateStore store;
  auto       run = MakeRun("r1", RunStatus::kRunning);
  store.Put(run);

  store.Cleanup("r1");
  assert(run.cancellation->IsCancelled());
  assert(!store.Find("r1").has_value());
  assert(store.RetiredCount() == 1);
  store.Cleanup("r1");
  store.Cleanup("never-existed");

  // late updates from the executor are dropped
  store.Put(run);
  assert(store.Size() == 0);
  run.status = RunStatus::kCancelled;
  store.Put(run);
  assert(store.Size() == 0);

  // the terminal update releases the id
  assert(store.RetiredCount() == 0);
}

void TestRunIdCanBeReused() {
  StateStore store;

  store.Put(MakeRun("finished", RunStatus::kSucceeded));
  store.Cleanup("finished");
  assert(store.RetiredCount() == 0);

  auto again = MakeRun("finished", RunStatus::kRunning);
  store.Put(again);
  assert(store.Get("finished").status == RunStatus::kRunning);
  assert(store.Cancel("finished"));
  assert(again.cancellation->IsCancelled());

  // reuse while the cleaned-up run is still winding down
  auto stale = MakeRun("busy", RunStatus::kRunning);
  store.Put(stale);
  store.Cleanup("busy");

  auto fresh = MakeRun("busy", RunStatus::kRunning);
  store.Put(fresh);
  assert(store.RetiredCount() == 0);
  assert(store.ListActive().size() == 2);
  assert(!fresh.cancellation->IsCancelled());

  // the old run can no longer overwrite the new one
  bool threw = false;
  try {
    stale.status = RunStatus::kCancelled;
    store.Put(stale);
  } catch (const chainweave::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(store.Get("busy").status == RunStatus::kRunning);
}

void TestActiveRunIdIsNotShared() {
  StateStore store;
  store.Put(MakeRun("r1", RunStatus::kRunning));

  bool threw = false;
  try {
    store.Put(MakeRun("r1", RunStatus::kRunning));
  } catch (const chainweave::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestCleanupFinishedLeavesNoTombstones() {
  StateStore store;
  for (int i = 0; i < 100; ++i) {
    store.Put(MakeRun("run-" + std::to_string(i), RunStatus::kSucceeded));
  }
  assert(store.CleanupFinished() == 100);
  assert(store.Size() == 0);
  assert(store.RetiredCount() == 0);
}

void TestCleanupArchivesFinishedRuns() {
  auto       archive = std::make_shared<chainweave::db::memory::MemoryRunArchive>();
  StateStore store(archive);

  store.Put(MakeRun("a", RunStatus::kSucceeded));
  store.Put(MakeRun("b", RunStatus::kRunning));
  store.Put(MakeRun("c", RunStatus::kPartialFailure));

  assert(store.CleanupFinished() == 2);
  assert(store.Size() == 1);
  assert(store.Find("b").has_value());

  auto record = store.FindArchived("a");
  assert(record.has_value());
  assert(record->status == "SUCCEEDED");
  assert(record->goal_tag == "report");
  assert(record->snapshot_json.find("\"run_id\":\"a\"") != std::string::npos);
  assert(!store.FindArchived("b").has_value());

  auto tx      = archive->Begin();
  auto samples = archive->ListPerformance(*tx, "Analyze");
  assert(samples.size() == 2);
  assert(samples[0].success);
  assert(samples[0].duration_ms == 5.0);
}

void TestConcurrentWritersOnDistinctRuns() {
  StateStore               store;
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, t] {
      auto run = MakeRun("run-" + std::to_string(t), RunStatus::kRunning);
      for (int i = 0; i < 200; ++i) {
        store.Put(run);
        auto copy = store.Get(run.run_id);
        assert(copy.run_id == run.run_id);
      }
    });
  }
  for (auto& w : writers) w.join();
  assert(store.Size() == 4);
  assert(store.ListActive().size() == 4);
}

} // namespace

int main() {
  TestGetReturnsCopies();
  TestListActiveAndCancel();
  TestCleanupIsIdempotent();
  TestRunIdCanBeReused();
  TestActiveRunIdIsNotShared();
  TestCleanupFinishedLeavesNoTombstones();
  TestCleanupArchivesFinishedRuns();
  TestConcurrentWritersOnDistinctRuns();

  std::cout << "state_store_test: pass\n";
  return 0;
}
