#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace outflow::util {

/*
  Time utilities. Engine timestamps are Unix milliseconds; calendar
  boundaries are UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMs();

uint64_t ToUnixMillis(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration);

uint64_t StartOfUtcDayMs(uint64_t unix_ms);
uint64_t StartOfUtcMonthMs(uint64_t unix_ms);

// Calendar month arithmetic; the day is clamped to the end of the target month.
uint64_t AddMonthsMs(uint64_t unix_ms, uint32_t months);

} // namespace outflow::util
