#pragma once

#include <cstdint>
#include <string>

namespace chainweave::db::model {

struct PerformanceRecord {
  std::string plugin_name;
  std::string run_id;
  double      duration_ms    = 0.0;
  bool        success        = false;
  uint64_t    recorded_at_ms = 0;
};

} // namespace chainweave::db::model
