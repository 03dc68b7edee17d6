#include "submit_logic.h"

#include "cedu/core/normalization.h"
#include "cedu/homework/submission_builder.h"

#include <iostream>
#include <utility>

int execute_submit(const SubmitRequest& request, const cedu::config::Settings& settings,
                   cedu::core::IClock& clock, cedu::homework::ISubmissionStore& store,
                   std::ostream& out) {
  // Everything below is hashed and written as JSON; both need valid UTF-8.
  bool text_ok = cedu::core::is_valid_utf8(request.assignment_id) &&
                 cedu::core::is_valid_utf8(request.answers_text);
  for (const auto& attachment : request.attachments) {
    text_ok = text_ok && cedu::core::is_valid_utf8(attachment);
  }
  if (!text_ok) {
    std::cerr << "Submission text must be valid UTF-8; nothing was written.\n";
    return 1;
  }

  cedu::homework::SubmissionRequest submission{
      cedu::homework::resolve_student_identity(settings.student),
      request.assignment_id,
      request.answers_text,
      request.attachments,
  };
  const auto record = cedu::homework::build_submission(std::move(submission), clock);

  auto saved = store.save(record);
  if (!saved.has_value()) {
    std::cerr << "Failed to write submission: " << saved.error().message << "\n";
    return 1;
  }

  out << "Wrote submission to " << saved.value().path.string() << "\n";
  if (saved.value().replaced_existing) {
    out << "  (replaced an earlier submission for this assignment)\n";
  }
  out << "  Events: " << record.events.size() << "\n";
  out << "  Final hash: " << record.final_hash.value_or("-") << "\n";
  if (record.ai_premark.has_value() && record.ai_premark->score.has_value()) {
    out << "  Premark: " << record.ai_premark->score.value() << " - "
        << record.ai_premark->feedback.value_or("") << "\n";
  }
  return 0;
}
