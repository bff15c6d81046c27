#pragma once

#include <cstdint>
#include <string>

namespace chainweave::db::model {

struct RunRecord {
  std::string run_id;
  std::string fingerprint;
  std::string goal_tag;
  std::string mode;
  std::string status;
  uint64_t    started_at_ms = 0;
  uint64_t    ended_at_ms   = 0;
  bool        aborted       = false;

  // protobuf JSON of chainweave.chain.v1.ChainRun
  std::string snapshot_json;
};

} // namespace chainweave::db::model
