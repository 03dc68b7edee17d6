#include "cedu/core/clock.h"

#include "cedu/core/time.h"

namespace cedu::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(Clock::now());
}

std::string SystemClock::now_iso8601() {
  return format_iso8601_utc(now_unix_millis());
}

std::int64_t FixedClock::now_unix_millis() {
  return unix_millis_;
}

std::string FixedClock::now_iso8601() {
  return format_iso8601_utc(unix_millis_);
}

std::int64_t SteppingClock::now_unix_millis() {
  const std::int64_t current = next_millis_;
  next_millis_ += step_millis_;
  return current;
}

std::string SteppingClock::now_iso8601() {
  return format_iso8601_utc(next_millis_);
}

}  // namespace cedu::core
