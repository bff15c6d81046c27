#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/cancellation.hpp"
#include "internal/model/chain.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/value.hpp"
#include "internal/util/time.hpp"

namespace chainweave::model {

enum class ExecutionMode : std::uint8_t {
  kSequential = 0,
  kParallel   = 1,
  kAdaptive   = 2,
};

// Codes carried in ErrorInfo::code.
namespace error_code {
inline constexpr std::string_view kPluginError      = "plugin_error";
inline constexpr std::string_view kException        = "exception";
inline constexpr std::string_view kTimeout          = "timeout";
inline constexpr std::string_view kUnboundPlugin    = "unbound_plugin";
inline constexpr std::string_view kMissingInput     = "missing_input";
inline constexpr std::string_view kMissingOutput    = "missing_output";
inline constexpr std::string_view kDependencyFailed = "dependency_failed";
inline constexpr std::string_view kChainAborted     = "chain_aborted";
inline constexpr std::string_view kCancelled        = "cancelled";
} // namespace error_code

struct ErrorInfo {
  std::string code;
  std::string message;
};

struct NodeState {
  NodeStatus               status = NodeStatus::kPending;
  ValueMap                 output;
  std::optional<ErrorInfo> error;
  util::TimePoint          started_at{};
  util::TimePoint          ended_at{};
};

/*
  Execution record of one chain.

  Mutated only by the executor that created it; everybody else works on
  copies obtained from the StateStore. Copies share the chain and the
  cancellation token.
*/
struct ChainRun {
  std::string                  run_id;
  std::shared_ptr<const Chain> chain;

  ExecutionMode mode   = ExecutionMode::kSequential;
  RunStatus     status = RunStatus::kPending;

  std::map<std::string, NodeState> node_states;

  util::TimePoint started_at{};
  util::TimePoint ended_at{};

  // set when fail-fast stopped the chain
  bool                     aborted = false;
  std::optional<ErrorInfo> error;

  std::shared_ptr<CancellationToken> cancellation;

  // terminal nodes / total nodes, 1.0 for an empty chain
  double Progress() const;

  const NodeState* FindNode(const std::string& node_id) const;
};

std::string_view ToString(ExecutionMode mode);
std::string_view ToString(RunStatus status);
std::string_view ToString(NodeStatus status);

std::optional<ExecutionMode> ParseExecutionMode(std::string_view text);

} // namespace chainweave::model
