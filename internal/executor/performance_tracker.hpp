#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chainweave::executor {

inline constexpr std::size_t kDefaultPerformanceHistory = 100;

struct PerformanceStats {
  double      avg_ms   = 0.0;
  double      min_ms   = 0.0;
  double      max_ms   = 0.0;
  std::size_t count    = 0;
  std::size_t failures = 0;
};

/*
  Rolling per-plugin execution history. Only the latest `history_limit`
  samples of each plugin are kept.
*/
class PerformanceTracker {
 public:
  explicit PerformanceTracker(std::size_t history_limit = kDefaultPerformanceHistory);

  void Record(const std::string& plugin_name, double duration_ms, bool success);

  std::optional<PerformanceStats> Stats(const std::string& plugin_name) const;

  std::map<std::string, PerformanceStats> Snapshot() const;

  // Sum of the known averages; plugins without history count as zero.
  double EstimateMillis(const std::vector<std::string>& plugin_names) const;

  std::size_t HistoryLimit() const {
    return history_limit_;
  }

 private:
  struct Sample {
    double duration_ms;
    bool   success;
  };

  static PerformanceStats Summarize(const std::deque<Sample>& samples);

  std::size_t                                history_limit_;
  mutable std::mutex                         mutex_;
  std::map<std::string, std::deque<Sample>> history_;
};

} // namespace chainweave::executor
