#include "internal/model/chain_run.hpp"

namespace chainweave::model {

double ChainRun::Progress() const {
  if (node_states.empty()) {
    return 1.0;
  }
  std::size_t terminal = 0;
  for (const auto& [_, state] : node_states) {
    if (IsTerminal(state.status)) ++terminal;
  }
  return static_cast<double>(terminal) / static_cast<double>(node_states.size());
}

const NodeState* ChainRun::FindNode(const std::string& node_id) const {
  auto it = node_states.find(node_id);
  return it == node_states.end() ? nullptr : &it->second;
}

std::string_view ToString(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::kSequential:
      return "sequential";
    case ExecutionMode::kParallel:
      return "parallel";
    case ExecutionMode::kAdaptive:
      return "adaptive";
  }
  return "unknown";
}

std::string_view ToString(RunStatus status) {
  switch (status) {
    case RunStatus::kPending:
      return "PENDING";
    case RunStatus::kRunning:
      return "RUNNING";
    case RunStatus::kSucceeded:
      return "SUCCEEDED";
    case RunStatus::kPartialFailure:
      return "PARTIAL_FAILURE";
    case RunStatus::kFailed:
      return "FAILED";
    case RunStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

std::string_view ToString(NodeStatus status) {
  switch (status) {
    case NodeStatus::kPending:
      return "PENDING";
    case NodeStatus::kRunning:
      return "RUNNING";
    case NodeStatus::kSucceeded:
      return "SUCCEEDED";
    case NodeStatus::kFailed:
      return "FAILED";
    case NodeStatus::kSkipped:
      return "SKIPPED";
  }
  return "UNKNOWN";
}

std::optional<ExecutionMode> ParseExecutionMode(std::string_view text) {
  if (text == "sequential") {
    return ExecutionMode::kSequential;
  }
  if (text == "parallel") {
    return ExecutionMode::kParallel;
  }
  if (text == "adaptive") {
    return ExecutionMode::kAdaptive;
  }
  return std::nullopt;
}

} // namespace chainweave::model
