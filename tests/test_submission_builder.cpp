#include "cedu/core/clock.h"
#include "cedu/homework/submission_builder.h"
#include "cedu/integrity/event_chain.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace cedu;
using homework::BuilderState;
using homework::SubmissionBuilder;
using integrity::EventKind;

namespace {

homework::SubmissionRequest make_request(const std::string& answer = "My answer") {
  homework::StudentIdentity identity;
  identity.class_id = "7B";
  identity.student_id = "s1";
  identity.student_name = "Sam";
  return {identity, "hw-1", answer, {}};
}

}  // namespace

TEST_CASE("SubmissionBuilder: steps run in order and chain their hashes", "[builder]") {
  core::SteppingClock clock(1700000000000, 1000);
  SubmissionBuilder builder(make_request(), clock);
  CHECK(builder.state() == BuilderState::kNotStarted);

  const auto start = builder.start();
  REQUIRE(start.has_value());
  CHECK(start.value().kind == EventKind::kStart);
  CHECK(start.value().previous_hash.empty());
  CHECK(start.value().payload == std::optional<std::string>("session_start"));
  CHECK_FALSE(start.value().question_id.has_value());
  CHECK(builder.state() == BuilderState::kStarted);

  const auto answer = builder.record_answer("My answer");
  REQUIRE(answer.has_value());
  CHECK(answer.value().kind == EventKind::kAnswer);
  CHECK(answer.value().previous_hash == start.value().hash);
  CHECK(answer.value().question_id == std::optional<std::string>("freeform"));
  CHECK(answer.value().payload == std::optional<std::string>("My answer"));

  const auto record = builder.finalize();
  REQUIRE(record.has_value());
  CHECK(builder.state() == BuilderState::kFinalized);

  const auto& events = record.value().events;
  REQUIRE(events.size() == 3);
  CHECK(events[2].kind == EventKind::kFinalize);
  CHECK(events[2].previous_hash == events[1].hash);
  CHECK(events[2].payload == std::optional<std::string>("submitted"));
  CHECK(record.value().final_hash == std::optional<std::string>(events[2].hash));
}

TEST_CASE("SubmissionBuilder: each step reads its own timestamp", "[builder]") {
  core::SteppingClock clock(1700000000000, 1000);
  const auto record = homework::build_submission(make_request(), clock);

  REQUIRE(record.events.size() == 3);
  CHECK(record.events[0].timestamp_ms == 1700000000000);
  CHECK(record.events[1].timestamp_ms == 1700000001000);
  CHECK(record.events[2].timestamp_ms == 1700000002000);
}

TEST_CASE("SubmissionBuilder: out-of-order steps are rejected without side effects",
          "[builder]") {
  core::FixedClock clock(1700000000000);
  SubmissionBuilder builder(make_request(), clock);

  const auto early_answer = builder.record_answer("My answer");
  REQUIRE_FALSE(early_answer.has_value());
  CHECK(early_answer.error().state == BuilderState::kNotStarted);
  CHECK(builder.events().empty());

  const auto early_finalize = builder.finalize();
  REQUIRE_FALSE(early_finalize.has_value());

  REQUIRE(builder.start().has_value());
  const auto second_start = builder.start();
  REQUIRE_FALSE(second_start.has_value());
  CHECK(second_start.error().state == BuilderState::kStarted);
  CHECK(builder.events().size() == 1);

  REQUIRE(builder.record_answer("My answer").has_value());
  CHECK_FALSE(builder.record_answer("again").has_value());
  REQUIRE(builder.finalize().has_value());
  CHECK_FALSE(builder.finalize().has_value());
  CHECK(builder.events().size() == 3);
}

TEST_CASE("build_submission: record carries identity, answer and premark", "[builder]") {
  core::FixedClock clock(1700000000000);
  homework::SubmissionRequest request = make_request("Short");
  request.attachments = {"drawing.png"};

  const auto record = homework::build_submission(request, clock);
  CHECK(record.version == "1.0");
  CHECK(record.school_id == "school");
  CHECK(record.class_id == "7B");
  CHECK(record.assignment_id == "hw-1");
  CHECK(record.student_id == "s1");
  CHECK(record.student_name == "Sam");
  CHECK(record.submitted_at == "2023-11-14T22:13:20Z");
  CHECK(record.answers_text == std::optional<std::string>("Short"));
  CHECK(record.attachments == std::vector<std::string>{"drawing.png"});
  REQUIRE(record.ai_premark.has_value());
  CHECK(record.ai_premark->score == std::optional<int>(50));
  CHECK_FALSE(record.summary.has_value());
}

TEST_CASE("build_submission: empty answer still produces an answer event", "[builder]") {
  core::FixedClock clock(1);
  const auto record = homework::build_submission(make_request(""), clock);
  REQUIRE(record.events.size() == 3);
  CHECK(record.events[1].payload == std::optional<std::string>(""));
}

TEST_CASE("SubmissionBuilder: answer text that is not UTF-8 is rejected", "[builder]") {
  core::FixedClock clock(1700000000000);
  SubmissionBuilder builder(make_request(), clock);
  REQUIRE(builder.start().has_value());

  const auto bad = builder.record_answer("caf\xE9");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().state == BuilderState::kStarted);
  CHECK(builder.state() == BuilderState::kStarted);
  CHECK(builder.events().size() == 1);

  // The rejected step leaves the builder usable.
  REQUIRE(builder.record_answer("caf\xC3\xA9").has_value());
  const auto record = builder.finalize();
  REQUIRE(record.has_value());
  CHECK(record.value().answers_text == std::optional<std::string>("caf\xC3\xA9"));
}

TEST_CASE("build_submission: invalid UTF-8 answers throw instead of hashing", "[builder]") {
  core::FixedClock clock(1700000000000);
  CHECK_THROWS_AS(homework::build_submission(make_request("caf\xE9"), clock),
                  std::invalid_argument);
  CHECK_THROWS_AS(homework::build_submission(make_request("caf\xFF"), clock),
                  std::invalid_argument);
}

TEST_CASE("resolve_student_identity: blank profile fields fall back to defaults", "[builder]") {
  const auto blank = homework::resolve_student_identity({});
  CHECK(blank.school_id == "school");
  CHECK(blank.student_id == "student-id");
  CHECK(blank.student_name == "Student");
  CHECK(blank.class_id == "class");

  const auto filled = homework::resolve_student_identity({"s9", "Ada", "8C"});
  CHECK(filled.student_id == "s9");
  CHECK(filled.student_name == "Ada");
  CHECK(filled.class_id == "8C");
}
