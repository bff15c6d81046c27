#include "time.hpp"

namespace chainweave::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

double ElapsedMillis(TimePoint start, TimePoint end) {
  if (start == TimePoint{} || end == TimePoint{} || end < start) {
    return 0.0;
  }
  return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace chainweave::util
