#pragma once

#include "cedu/config/settings.h"
#include "cedu/core/clock.h"
#include "cedu/homework/submission_store.h"

#include <ostream>
#include <string>
#include <vector>

struct SubmitRequest {
  std::string assignment_id;             // NOLINT(readability-identifier-naming)
  std::string answers_text;              // NOLINT(readability-identifier-naming)
  std::vector<std::string> attachments;  // NOLINT(readability-identifier-naming)
};

// execute_submit: run the start/answer/finalize lifecycle for the profile in
// settings and hand the record to store. Returns the process exit code.
// Takes only interface types; the concrete store is chosen by the caller.
// Text that is not valid UTF-8 is refused with exit code 1 before anything is built.
int execute_submit(const SubmitRequest& request, const cedu::config::Settings& settings,
                   cedu::core::IClock& clock, cedu::homework::ISubmissionStore& store,
                   std::ostream& out);
