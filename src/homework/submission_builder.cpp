#include "cedu/homework/submission_builder.h"

#include "cedu/core/normalization.h"
#include "cedu/core/version.h"
#include "cedu/homework/premark.h"
#include "cedu/integrity/event_chain.h"

#include <stdexcept>
#include <utility>

namespace cedu::homework {

namespace {

const char* state_name(BuilderState state) {
  switch (state) {
    case BuilderState::kNotStarted:
      return "not_started";
    case BuilderState::kStarted:
      return "started";
    case BuilderState::kAnswered:
      return "answered";
    case BuilderState::kFinalized:
      return "finalized";
  }
  return "unknown";
}

}  // namespace

StudentIdentity resolve_student_identity(const config::StudentProfile& profile) {
  StudentIdentity identity;
  identity.student_id = profile.student_id.empty() ? "student-id" : profile.student_id;
  identity.student_name = profile.student_name.empty() ? "Student" : profile.student_name;
  identity.class_id = profile.class_id.empty() ? "class" : profile.class_id;
  return identity;
}

SubmissionBuilder::SubmissionBuilder(SubmissionRequest request, core::IClock& clock)
    : request_(std::move(request)), clock_(clock) {}

const std::string& SubmissionBuilder::last_hash() const {
  return events_.back().hash;
}

TransitionError SubmissionBuilder::wrong_state(const char* step) const {
  return TransitionError{state_, std::string(step) + " is not allowed in state " +
                                     state_name(state_)};
}

core::Result<integrity::SubmissionEvent, TransitionError> SubmissionBuilder::start() {
  using R = core::Result<integrity::SubmissionEvent, TransitionError>;
  if (state_ != BuilderState::kNotStarted) {
    return R::err(wrong_state("start"));
  }

  events_.push_back(integrity::make_event(integrity::kChainStartHash, clock_.now_unix_millis(),
                                          integrity::EventKind::kStart, std::nullopt,
                                          std::string(kStartPayload)));
  state_ = BuilderState::kStarted;
  return R::ok(events_.back());
}

core::Result<integrity::SubmissionEvent, TransitionError> SubmissionBuilder::record_answer(
    std::string text) {
  using R = core::Result<integrity::SubmissionEvent, TransitionError>;
  if (state_ != BuilderState::kStarted) {
    return R::err(wrong_state("record_answer"));
  }
  if (!core::is_valid_utf8(text)) {
    return R::err(TransitionError{state_, "answer text is not valid UTF-8"});
  }

  events_.push_back(integrity::make_event(last_hash(), clock_.now_unix_millis(),
                                          integrity::EventKind::kAnswer,
                                          std::string(kFreeformQuestionId), text));
  answer_text_ = std::move(text);
  state_ = BuilderState::kAnswered;
  return R::ok(events_.back());
}

core::Result<SubmissionRecord, TransitionError> SubmissionBuilder::finalize() {
  using R = core::Result<SubmissionRecord, TransitionError>;
  if (state_ != BuilderState::kAnswered) {
    return R::err(wrong_state("finalize"));
  }

  events_.push_back(integrity::make_event(last_hash(), clock_.now_unix_millis(),
                                          integrity::EventKind::kFinalize, std::nullopt,
                                          std::string(kFinalizePayload)));
  state_ = BuilderState::kFinalized;

  SubmissionRecord record;
  record.version = core::kDocumentVersion;
  record.school_id = request_.identity.school_id;
  record.class_id = request_.identity.class_id;
  record.assignment_id = request_.assignment_id;
  record.student_id = request_.identity.student_id;
  record.student_name = request_.identity.student_name;
  record.submitted_at = clock_.now_iso8601();
  record.answers_text = answer_text_;
  record.ai_premark = simple_premark(answer_text_);
  record.attachments = request_.attachments;
  record.events = events_;
  record.final_hash = last_hash();
  return R::ok(std::move(record));
}

SubmissionRecord build_submission(SubmissionRequest request, core::IClock& clock) {
  std::string answer = request.answers_text;
  SubmissionBuilder builder(std::move(request), clock);
  // A fresh builder always accepts start.
  if (!builder.start().has_value()) {
    throw std::logic_error("submission lifecycle rejected start");
  }
  auto answered = builder.record_answer(std::move(answer));
  if (!answered.has_value()) {
    throw std::invalid_argument(answered.error().message);
  }
  auto record = builder.finalize();
  if (!record.has_value()) {
    throw std::logic_error(record.error().message);
  }
  return std::move(record.value());
}

}  // namespace cedu::homework
