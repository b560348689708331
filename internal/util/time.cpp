#include "time.hpp"

namespace outflow::util {

using std::chrono::days;
using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::sys_days;

namespace {

TimePoint FromUnixMillis(uint64_t unix_ms) {
  return TimePoint{duration_cast<Clock::duration>(milliseconds(unix_ms))};
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration) {
  return duration_cast<milliseconds>(std::chrono::seconds(duration.seconds()) + std::chrono::nanoseconds(duration.nanos()));
}

uint64_t StartOfUtcDayMs(uint64_t unix_ms) {
  const auto day = std::chrono::floor<days>(FromUnixMillis(unix_ms));
  return ToUnixMillis(day);
}

uint64_t StartOfUtcMonthMs(uint64_t unix_ms) {
  const std::chrono::year_month_day ymd{std::chrono::floor<days>(FromUnixMillis(unix_ms))};
  return ToUnixMillis(sys_days{ymd.year() / ymd.month() / std::chrono::day{1}});
}

uint64_t AddMonthsMs(uint64_t unix_ms, uint32_t months) {
  const auto tp          = FromUnixMillis(unix_ms);
  const auto day_start   = std::chrono::floor<days>(tp);
  const auto time_of_day = tp - day_start;

  const std::chrono::year_month_day ymd{day_start};
  auto target = ymd.year() / ymd.month() / ymd.day();
  target += std::chrono::months(months);
  if (!target.ok()) {
    target = target.year() / target.month() / std::chrono::last;
  }
  return ToUnixMillis(sys_days{target} + time_of_day);
}

} // namespace outflow::util
