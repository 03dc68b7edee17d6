#include "cedu/core/clock.h"
#include "cedu/core/time.h"

#include <catch2/catch_test_macros.hpp>

using namespace cedu::core;

TEST_CASE("format_iso8601_utc: epoch and a known instant", "[time]") {
  CHECK(format_iso8601_utc(0) == "1970-01-01T00:00:00Z");
  CHECK(format_iso8601_utc(1700000000000) == "2023-11-14T22:13:20Z");
}

TEST_CASE("parse_rfc3339_millis: Z suffix", "[time]") {
  const auto ms = parse_rfc3339_millis("2023-11-14T22:13:20Z");
  REQUIRE(ms.has_value());
  CHECK(ms.value() == 1700000000000);
}

TEST_CASE("parse_rfc3339_millis: fractional seconds and offsets", "[time]") {
  const auto frac = parse_rfc3339_millis("2023-11-14T22:13:20.250Z");
  REQUIRE(frac.has_value());
  CHECK(frac.value() == 1700000000250);

  const auto plus_two = parse_rfc3339_millis("2023-11-15T00:13:20+02:00");
  REQUIRE(plus_two.has_value());
  CHECK(plus_two.value() == 1700000000000);
}

TEST_CASE("parse_rfc3339_millis: rejects malformed text", "[time]") {
  CHECK_FALSE(parse_rfc3339_millis("").has_value());
  CHECK_FALSE(parse_rfc3339_millis("not a date").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2023-11-14").has_value());
}

TEST_CASE("SteppingClock: each millisecond read advances by the step", "[time][clock]") {
  SteppingClock clock(1000, 250);
  CHECK(clock.now_unix_millis() == 1000);
  CHECK(clock.now_unix_millis() == 1250);
  CHECK(clock.now_iso8601() == "1970-01-01T00:00:01Z");
  CHECK(clock.now_unix_millis() == 1500);
}

TEST_CASE("FixedClock: always the same instant", "[time][clock]") {
  FixedClock clock(1700000000000);
  CHECK(clock.now_unix_millis() == 1700000000000);
  CHECK(clock.now_unix_millis() == 1700000000000);
  CHECK(clock.now_iso8601() == "2023-11-14T22:13:20Z");
}
