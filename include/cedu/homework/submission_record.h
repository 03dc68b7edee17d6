#pragma once

#include "cedu/homework/premark.h"
#include "cedu/integrity/chain_verifier.h"
#include "cedu/integrity/submission_event.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cedu::homework {

struct AnswerEntry {
  std::string question;  // NOLINT(readability-identifier-naming)
  std::string response;  // NOLINT(readability-identifier-naming)

  bool operator==(const AnswerEntry&) const = default;
};

// One student's completed work on one assignment.
// Built once by SubmissionBuilder and never mutated afterwards; a re-export
// produces a new record (and, under the default store policy, replaces the file).
//
// attachments are stored alongside the chain but are not committed to by any hash.
struct SubmissionRecord {
  std::string version;                                // NOLINT(readability-identifier-naming)
  std::string school_id;                              // NOLINT(readability-identifier-naming)
  std::string class_id;                               // NOLINT(readability-identifier-naming)
  std::string assignment_id;                          // NOLINT(readability-identifier-naming)
  std::string student_id;                             // NOLINT(readability-identifier-naming)
  std::string student_name;                           // NOLINT(readability-identifier-naming)
  std::string submitted_at;                           // ISO 8601 UTC
  std::optional<std::string> answers_text;            // NOLINT(readability-identifier-naming)
  std::vector<AnswerEntry> answers;                   // NOLINT(readability-identifier-naming)
  std::optional<Premark> ai_premark;                  // NOLINT(readability-identifier-naming)
  std::vector<std::string> attachments;               // NOLINT(readability-identifier-naming)
  std::vector<integrity::SubmissionEvent> events;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> final_hash;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> summary;                 // NOLINT(readability-identifier-naming)

  bool operator==(const SubmissionRecord&) const = default;
};

// Dashboard projection. Produced without re-verifying the chain.
struct SubmissionSummary {
  std::string assignment_id;            // NOLINT(readability-identifier-naming)
  std::string student_id;               // NOLINT(readability-identifier-naming)
  std::string student_name;             // NOLINT(readability-identifier-naming)
  std::string submitted_at;             // NOLINT(readability-identifier-naming)
  std::optional<int> score;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> feedback;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] SubmissionSummary summarize(const SubmissionRecord& record);

// Runs the chain verifier over record.events and record.final_hash.
[[nodiscard]] integrity::ChainVerification verify_submission(const SubmissionRecord& record);

// Serialization. Keys sort alphabetically (nlohmann::json default object type is std::map).
// Optional scalars are written as null; summary is always present (null when unset).
[[nodiscard]] nlohmann::json submission_to_json(const SubmissionRecord& record);

// Identity fields and submitted_at are required; everything else defaults when missing.
// Throws nlohmann::json::exception on missing required fields or type mismatches and
// std::invalid_argument on an unknown event type.
[[nodiscard]] SubmissionRecord submission_from_json(const nlohmann::json& j);

}  // namespace cedu::homework
