#pragma once

#include <cstdint>

namespace chainweave::model {

enum class NodeStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kSucceeded = 2,
  kFailed    = 3,
  kSkipped   = 4,
};

enum class RunStatus : std::uint8_t {
  kPending        = 0,
  kRunning        = 1,
  kSucceeded      = 2,
  kPartialFailure = 3,
  kFailed         = 4,
  kCancelled      = 5,
};

constexpr bool IsTerminal(NodeStatus status) {
  return status == NodeStatus::kSucceeded || status == NodeStatus::kFailed || status == NodeStatus::kSkipped;
}

constexpr bool IsTerminal(RunStatus status) {
  return status != RunStatus::kPending && status != RunStatus::kRunning;
}

// PENDING -> RUNNING -> SUCCEEDED|FAILED, or PENDING -> SKIPPED.
constexpr bool CanTransition(NodeStatus from, NodeStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == NodeStatus::kPending) {
    return to == NodeStatus::kRunning || to == NodeStatus::kSkipped;
  }
  return to == NodeStatus::kSucceeded || to == NodeStatus::kFailed;
}

constexpr bool CanTransition(RunStatus from, RunStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == RunStatus::kPending) {
    return to != RunStatus::kPending;
  }
  return to != RunStatus::kPending && to != RunStatus::kRunning;
}

} // namespace chainweave::model
