#include "time.hpp"

namespace macrelay::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto seconds     = std::chrono::floor<std::chrono::seconds>(since_epoch);

  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds.count());
  ts.set_nanos(static_cast<std::int32_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds).count()));
  return ts;
}

double MillisSince(SteadyTimePoint started_at) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - started_at).count();
}

} // namespace macrelay::util
