#pragma once

#include "cedu/core/result.h"
#include "cedu/integrity/submission_event.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cedu::integrity {

enum class IntegrityErrorKind {
  kEmptyChain,             // NOLINT(readability-identifier-naming)
  kPreviousHashMismatch,   // NOLINT(readability-identifier-naming)
  kHashMismatch,           // NOLINT(readability-identifier-naming)
  kFinalHashMismatch,      // NOLINT(readability-identifier-naming)
  kLifecycleViolation,     // NOLINT(readability-identifier-naming)
};

[[nodiscard]] const char* to_string(IntegrityErrorKind kind);

// A chain that parsed fine but does not hold together.
// index is meaningful for the per-event kinds (kPreviousHashMismatch, kHashMismatch)
// and for kLifecycleViolation; it is 0 otherwise.
struct IntegrityError {
  IntegrityErrorKind kind{IntegrityErrorKind::kEmptyChain};  // NOLINT
  std::size_t index{0};                                      // NOLINT
  std::string message;                                       // NOLINT
};

// Ok value: number of events verified.
using ChainVerification = core::Result<std::size_t, IntegrityError>;

// Verify a submission event chain in stored order.
//
// Checks, first failure wins:
//   1. events is non-empty                                       -> kEmptyChain
//   2. for each event i, with expected_previous starting at "":
//      event.previous_hash == expected_previous                  -> kPreviousHashMismatch{i}
//      recompute(event, expected_previous) == event.hash         -> kHashMismatch{i}
//      (text that is not valid UTF-8 cannot be encoded and also yields kHashMismatch{i})
//      expected_previous = event.hash
//   3. final_hash is present and equals the last event's hash    -> kFinalHashMismatch
//   4. shape is start, answer+, finalize                         -> kLifecycleViolation{i}
[[nodiscard]] ChainVerification verify_event_chain(const std::vector<SubmissionEvent>& events,
                                                   const std::optional<std::string>& final_hash);

}  // namespace cedu::integrity
