#pragma once

#include <cstdint>
#include <string>

namespace cedu::core {

// Abstract clock for timestamp injection.
// Production code reads system time; tests pin or step time explicitly.
class IClock {
 public:
  virtual ~IClock() = default;

  // Milliseconds since the unix epoch.
  virtual std::int64_t now_unix_millis() = 0;

  // Current time as ISO 8601 UTC ("2026-01-01T00:00:00Z").
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::int64_t now_unix_millis() override;
  std::string now_iso8601() override;
};

// Always returns the same instant.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t unix_millis) : unix_millis_(unix_millis) {}

  std::int64_t now_unix_millis() override;
  std::string now_iso8601() override;

 private:
  std::int64_t unix_millis_;
};

// Advances by a fixed step after every now_unix_millis() read.
// now_iso8601() reports the current instant without advancing.
class SteppingClock final : public IClock {
 public:
  SteppingClock(std::int64_t start_millis, std::int64_t step_millis)
      : next_millis_(start_millis), step_millis_(step_millis) {}

  std::int64_t now_unix_millis() override;
  std::string now_iso8601() override;

 private:
  std::int64_t next_millis_;
  std::int64_t step_millis_;
};

}  // namespace cedu::core
