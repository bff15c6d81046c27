#include "internal/state/state_store.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/serialization/chain_codec.hpp"
#include "internal/util/errors.hpp"

namespace chainweave::state {

StateStore::StateStore(std::shared_ptr<db::RunArchive> archive) : archive_(std::move(archive)) {
}

std::shared_ptr<StateStore::Slot> StateStore::FindSlot(const std::string& run_id) const {
  std::shared_lock lock(slots_mutex_);
  auto             it = slots_.find(run_id);
  return it == slots_.end() ? nullptr : it->second;
}

void StateStore::Put(const model::ChainRun& run) {
  if (run.run_id.empty()) {
    throw util::InvalidArgument("chain run without run id");
  }

  // slots_mutex_ stays held while writing so Cleanup never observes a
  // half-published run
  {
    std::shared_lock lock(slots_mutex_);
    auto             it = slots_.find(run.run_id);
    if (it != slots_.end() && retired_.count(run.run_id) == 0) {
      Write(*it->second, run);
      return;
    }
  }

  std::unique_lock lock(slots_mutex_);
  auto             retired = retired_.find(run.run_id);
  if (retired != retired_.end()) {
    if (retired->second == run.cancellation) {
      // the cleaned-up run itself; its terminal update is the last one
      if (model::IsTerminal(run.status)) retired_.erase(retired);
      return;
    }
    // a new run reusing the id
    retired_.erase(retired);
  }
  auto& entry = slots_[run.run_id];
  if (!entry) entry = std::make_shared<Slot>();
  Write(*entry, run);
}

void StateStore::Write(Slot& slot, const model::ChainRun& run) {
  std::unique_lock lock(slot.mutex);
  if (slot.run.run_id == run.run_id && slot.run.cancellation != run.cancellation && !model::IsTerminal(slot.run.status)) {
    throw util::InvalidState("run id '" + run.run_id + "' belongs to an active run");
  }
  slot.run = run;
}

model::ChainRun StateStore::Get(const std::string& run_id) const {
  auto run = Find(run_id);
  if (!run) {
    throw util::NotFound("chain run not found: " + run_id);
  }
  return std::move(*run);
}

std::optional<model::ChainRun> StateStore::Find(const std::string& run_id) const {
  auto slot = FindSlot(run_id);
  if (!slot) return std::nullopt;
  std::shared_lock lock(slot->mutex);
  return slot->run;
}

std::vector<model::ChainRun> StateStore::ListActive() const {
  std::vector<model::ChainRun> out;
  for (const auto& run_id : ListRunIds()) {
    auto run = Find(run_id);
    if (run && !model::IsTerminal(run->status)) out.push_back(std::move(*run));
  }
  return out;
}

std::vector<std::string> StateStore::ListRunIds() const {
  std::vector<std::string> ids;
  {
    std::shared_lock lock(slots_mutex_);
    ids.reserve(slots_.size());
    for (const auto& [id, _] : slots_) ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

bool StateStore::Cancel(const std::string& run_id) {
  auto slot = FindSlot(run_id);
  if (!slot) return false;

  std::shared_lock lock(slot->mutex);
  if (model::IsTerminal(slot->run.status) || !slot->run.cancellation) return false;
  slot->run.cancellation->Cancel();

  CHAINWEAVE_LOG_INFO("Chain run cancellation requested", {observability::StringField("run_id", run_id)});
  return true;
}

void StateStore::Cleanup(const std::string& run_id) {
  std::shared_ptr<Slot> slot;
  {
    std::unique_lock lock(slots_mutex_);
    auto             it = slots_.find(run_id);
    if (it == slots_.end()) return;
    slot = it->second;
    slots_.erase(it);

    std::shared_lock slot_lock(slot->mutex);
    if (!model::IsTerminal(slot->run.status)) {
      retired_[run_id] = slot->run.cancellation;
    }
  }

  model::ChainRun run;
  {
    std::shared_lock lock(slot->mutex);
    run = slot->run;
  }

  if (!model::IsTerminal(run.status)) {
    // the executor stops dispatching; its later updates are dropped
    if (run.cancellation) run.cancellation->Cancel();
  } else {
    Archive(run);
  }

  CHAINWEAVE_LOG_DEBUG("Chain run cleaned up",
                       {observability::StringField("run_id", run_id), observability::StringField("status", model::ToString(run.status))});
}

std::size_t StateStore::CleanupFinished() {
  std::size_t removed = 0;
  for (const auto& run_id : ListRunIds()) {
    auto run = Find(run_id);
    if (run && model::IsTerminal(run->status)) {
      Cleanup(run_id);
      ++removed;
    }
  }
  return removed;
}

std::size_t StateStore::Size() const {
  std::shared_lock lock(slots_mutex_);
  return slots_.size();
}

std::size_t StateStore::RetiredCount() const {
  std::shared_lock lock(slots_mutex_);
  return retired_.size();
}

std::optional<db::model::RunRecord> StateStore::FindArchived(const std::string& run_id) const {
  if (!archive_) return std::nullopt;
  std::lock_guard lock(archive_mutex_);
  auto            tx = archive_->Begin();
  return archive_->GetRun(*tx, run_id);
}

void StateStore::Archive(const model::ChainRun& run) {
  if (!archive_) return;

  try {
    std::lock_guard lock(archive_mutex_);
    auto            tx = archive_->Begin();

    auto result = archive_->InsertRun(*tx, ToRunRecord(run));
    if (!result) {
      CHAINWEAVE_LOG_ERROR("Failed to archive chain run",
                           {observability::StringField("run_id", run.run_id), observability::StringField("error", result.message)});
      return;
    }
    for (const auto& sample : ToPerformanceRecords(run)) {
      result = archive_->InsertPerformance(*tx, sample);
      if (!result) {
        CHAINWEAVE_LOG_ERROR("Failed to archive plugin performance",
                             {observability::StringField("run_id", run.run_id), observability::StringField("plugin", sample.plugin_name),
                              observability::StringField("error", result.message)});
        return;
      }
    }
    tx->Commit();
  } catch (const std::exception& e) {
    CHAINWEAVE_LOG_ERROR("Chain run archive unavailable", {observability::StringField("run_id", run.run_id), observability::StringField("error", e.what())});
  }
}

db::model::RunRecord ToRunRecord(const model::ChainRun& run) {
  db::model::RunRecord record;
  record.run_id        = run.run_id;
  record.fingerprint   = run.chain ? run.chain->fingerprint : std::string{};
  record.goal_tag      = run.chain ? run.chain->goal.required_output_tag : std::string{};
  record.mode          = std::string(model::ToString(run.mode));
  record.status        = std::string(model::ToString(run.status));
  record.started_at_ms = run.started_at == util::TimePoint{} ? 0 : util::ToUnixMillis(run.started_at);
  record.ended_at_ms   = run.ended_at == util::TimePoint{} ? 0 : util::ToUnixMillis(run.ended_at);
  record.aborted       = run.aborted;
  record.snapshot_json = serialization::ToJson(serialization::ToProto(run));
  return record;
}

std::vector<db::model::PerformanceRecord> ToPerformanceRecords(const model::ChainRun& run) {
  std::vector<db::model::PerformanceRecord> out;
  if (!run.chain) return out;

  for (const auto& node : run.chain->nodes) {
    const auto* state = run.FindNode(node.id);
    if (!state) continue;
    if (state->status != model::NodeStatus::kSucceeded && state->status != model::NodeStatus::kFailed) continue;
    // failures detected before the plugin was called carry no timing
    if (state->error && (state->error->code == model::error_code::kUnboundPlugin || state->error->code == model::error_code::kMissingInput)) {
      continue;
    }

    db::model::PerformanceRecord sample;
    sample.plugin_name    = node.plugin_name;
    sample.run_id         = run.run_id;
    sample.duration_ms    = util::ElapsedMillis(state->started_at, state->ended_at);
    sample.success        = state->status == model::NodeStatus::kSucceeded;
    sample.recorded_at_ms = util::ToUnixMillis(state->ended_at);
    out.push_back(std::move(sample));
  }
  return out;
}

} // namespace chainweave::state
