#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace macrelay::util {

// Wall clock for session start times shown to operators.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Monotonic clock for latencies, deadlines and job delays.
using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

double MillisSince(SteadyTimePoint started_at);

} // namespace macrelay::util
