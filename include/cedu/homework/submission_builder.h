#pragma once

#include "cedu/config/settings.h"
#include "cedu/core/clock.h"
#include "cedu/core/result.h"
#include "cedu/homework/submission_record.h"
#include "cedu/integrity/submission_event.h"

#include <string>
#include <vector>

namespace cedu::homework {

// Who is submitting. Resolve from settings with resolve_student_identity().
struct StudentIdentity {
  std::string school_id{"school"};  // NOLINT(readability-identifier-naming)
  std::string class_id;             // NOLINT(readability-identifier-naming)
  std::string student_id;           // NOLINT(readability-identifier-naming)
  std::string student_name;         // NOLINT(readability-identifier-naming)
};

// Applies the defaults for blank profile fields:
// student_id "student-id", student_name "Student", class_id "class"; school_id is "school".
[[nodiscard]] StudentIdentity resolve_student_identity(const config::StudentProfile& profile);

struct SubmissionRequest {
  StudentIdentity identity;              // NOLINT(readability-identifier-naming)
  std::string assignment_id;             // not checked against any pack
  std::string answers_text;              // passed to record_answer() by build_submission()
  std::vector<std::string> attachments;  // NOLINT(readability-identifier-naming)
};

// Payload and question id constants written by the lifecycle.
inline constexpr const char* kStartPayload = "session_start";
inline constexpr const char* kFreeformQuestionId = "freeform";
inline constexpr const char* kFinalizePayload = "submitted";

enum class BuilderState {
  kNotStarted,  // NOLINT(readability-identifier-naming)
  kStarted,     // NOLINT(readability-identifier-naming)
  kAnswered,    // NOLINT(readability-identifier-naming)
  kFinalized,   // NOLINT(readability-identifier-naming)
};

// Returned when a lifecycle step is called out of order, or record_answer() is given
// text that is not valid UTF-8.
struct TransitionError {
  BuilderState state{BuilderState::kNotStarted};  // state the builder was in
  std::string message;                            // NOLINT(readability-identifier-naming)
};

// Drives one submission through NotStarted -> Started -> Answered -> Finalized.
//
// Each step appends one hashed event chained onto the previous one and reads a
// fresh timestamp from the clock, so the time between stages is recoverable.
// Steps never go backwards; a step called in the wrong state leaves the builder
// untouched and returns TransitionError.
class SubmissionBuilder {
 public:
  SubmissionBuilder(SubmissionRequest request, core::IClock& clock);

  [[nodiscard]] BuilderState state() const { return state_; }
  [[nodiscard]] const std::vector<integrity::SubmissionEvent>& events() const { return events_; }

  // start event: prev "", payload "session_start".
  core::Result<integrity::SubmissionEvent, TransitionError> start();

  // answer event: prev = start hash, qid "freeform", payload = text.
  // text also becomes the record's answers_text and feeds the premark.
  core::Result<integrity::SubmissionEvent, TransitionError> record_answer(std::string text);

  // finalize event: prev = answer hash, payload "submitted". Returns the finished record.
  core::Result<SubmissionRecord, TransitionError> finalize();

 private:
  [[nodiscard]] const std::string& last_hash() const;
  [[nodiscard]] TransitionError wrong_state(const char* step) const;

  SubmissionRequest request_;
  std::string answer_text_;
  core::IClock& clock_;
  BuilderState state_{BuilderState::kNotStarted};
  std::vector<integrity::SubmissionEvent> events_;
};

// Runs the full lifecycle in order with request.answers_text as the answer.
// Throws std::invalid_argument if the answer text is not valid UTF-8; callers
// taking outside input check it with core::is_valid_utf8 first.
[[nodiscard]] SubmissionRecord build_submission(SubmissionRequest request, core::IClock& clock);

}  // namespace cedu::homework
