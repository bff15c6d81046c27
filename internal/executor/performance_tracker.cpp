#include "internal/executor/performance_tracker.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace chainweave::executor {

PerformanceTracker::PerformanceTracker(std::size_t history_limit) : history_limit_(history_limit) {
  if (history_limit_ == 0) {
    throw util::InvalidArgument("performance history limit must be positive");
  }
}

void PerformanceTracker::Record(const std::string& plugin_name, double duration_ms, bool success) {
  std::lock_guard lock(mutex_);
  auto&           samples = history_[plugin_name];
  samples.push_back(Sample{duration_ms, success});
  while (samples.size() > history_limit_) {
    samples.pop_front();
  }
}

std::optional<PerformanceStats> PerformanceTracker::Stats(const std::string& plugin_name) const {
  std::lock_guard lock(mutex_);
  auto            it = history_.find(plugin_name);
  if (it == history_.end() || it->second.empty()) return std::nullopt;
  return Summarize(it->second);
}

std::map<std::string, PerformanceStats> PerformanceTracker::Snapshot() const {
  std::lock_guard                         lock(mutex_);
  std::map<std::string, PerformanceStats> out;
  for (const auto& [name, samples] : history_) {
    if (!samples.empty()) out.emplace(name, Summarize(samples));
  }
  return out;
}

double PerformanceTracker::EstimateMillis(const std::vector<std::string>& plugin_names) const {
  double total = 0.0;
  for (const auto& name : plugin_names) {
    if (auto stats = Stats(name)) total += stats->avg_ms;
  }
  return total;
}

PerformanceStats PerformanceTracker::Summarize(const std::deque<Sample>& samples) {
  PerformanceStats stats;
  stats.count  = samples.size();
  stats.min_ms = samples.front().duration_ms;
  stats.max_ms = samples.front().duration_ms;

  double sum = 0.0;
  for (const auto& sample : samples) {
    sum += sample.duration_ms;
    stats.min_ms = std::min(stats.min_ms, sample.duration_ms);
    stats.max_ms = std::max(stats.max_ms, sample.duration_ms);
    if (!sample.success) ++stats.failures;
  }
  stats.avg_ms = sum / static_cast<double>(stats.count);
  return stats;
}

} // namespace chainweave::executor
