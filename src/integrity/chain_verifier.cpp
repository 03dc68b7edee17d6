#include "cedu/integrity/chain_verifier.h"

#include "cedu/integrity/event_chain.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace cedu::integrity {

namespace {

ChainVerification fail(IntegrityErrorKind kind, std::size_t index, std::string message) {
  return ChainVerification::err(IntegrityError{kind, index, std::move(message)});
}

}  // namespace

const char* to_string(IntegrityErrorKind kind) {
  switch (kind) {
    case IntegrityErrorKind::kEmptyChain:
      return "empty_chain";
    case IntegrityErrorKind::kPreviousHashMismatch:
      return "previous_hash_mismatch";
    case IntegrityErrorKind::kHashMismatch:
      return "hash_mismatch";
    case IntegrityErrorKind::kFinalHashMismatch:
      return "final_hash_mismatch";
    case IntegrityErrorKind::kLifecycleViolation:
      return "lifecycle_violation";
  }
  return "unknown";
}

ChainVerification verify_event_chain(const std::vector<SubmissionEvent>& events,
                                     const std::optional<std::string>& final_hash) {
  if (events.empty()) {
    return fail(IntegrityErrorKind::kEmptyChain, 0, "submission has no events");
  }

  std::string expected_previous{kChainStartHash};
  for (std::size_t i = 0; i < events.size(); ++i) {
    const SubmissionEvent& ev = events[i];

    if (ev.previous_hash != expected_previous) {
      return fail(IntegrityErrorKind::kPreviousHashMismatch, i,
                  "previous_hash mismatch at index " + std::to_string(i));
    }
    std::string recomputed;
    try {
      recomputed = recompute_event_hash(ev, expected_previous);
    } catch (const std::invalid_argument&) {
      return fail(IntegrityErrorKind::kHashMismatch, i,
                  "event text at index " + std::to_string(i) + " is not valid UTF-8");
    }
    if (recomputed != ev.hash) {
      return fail(IntegrityErrorKind::kHashMismatch, i,
                  "hash mismatch at index " + std::to_string(i));
    }
    expected_previous = ev.hash;
  }

  if (!final_hash.has_value() || final_hash.value() != expected_previous) {
    return fail(IntegrityErrorKind::kFinalHashMismatch, 0,
                "final_hash does not match the last event");
  }

  // A consistent chain can still be a truncated one.
  const std::size_t last = events.size() - 1;
  if (events.front().kind != EventKind::kStart) {
    return fail(IntegrityErrorKind::kLifecycleViolation, 0, "chain does not begin with start");
  }
  if (events.size() < 3) {
    return fail(IntegrityErrorKind::kLifecycleViolation, last,
                "chain is shorter than start, answer, finalize");
  }
  for (std::size_t i = 1; i < last; ++i) {
    if (events[i].kind != EventKind::kAnswer) {
      return fail(IntegrityErrorKind::kLifecycleViolation, i,
                  "expected answer event at index " + std::to_string(i));
    }
  }
  if (events[last].kind != EventKind::kFinalize) {
    return fail(IntegrityErrorKind::kLifecycleViolation, last, "chain does not end with finalize");
  }

  return ChainVerification::ok(events.size());
}

}  // namespace cedu::integrity
