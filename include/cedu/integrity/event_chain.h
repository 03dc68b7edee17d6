#pragma once

#include "cedu/integrity/submission_event.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cedu::integrity {

// previous_hash of the first event in every submission chain.
// The empty string is hashed like any other value; it is not a skip.
inline constexpr std::string_view kChainStartHash = "";

// Canonical byte encoding of an event's non-hash fields.
//
// Compact JSON with keys in the fixed order t, type, qid, payload, prev.
// Absent qid/payload are omitted entirely, so "absent" and "" encode differently.
// Strings use JSON escaping with raw UTF-8 for non-ASCII text.
// Throws std::invalid_argument if qid or payload is not valid UTF-8.
//
// Example: {"t":1700000000000,"type":"answer","qid":"freeform","payload":"hi","prev":"ab12..."}
[[nodiscard]] std::string canonical_event_encoding(std::int64_t timestamp_ms, EventKind kind,
                                                   const std::optional<std::string>& question_id,
                                                   const std::optional<std::string>& payload,
                                                   std::string_view previous_hash);

// SHA-256 over previous_hash bytes followed by canonical_encoding.
// Output: 64-character lowercase hex string. Pure.
[[nodiscard]] std::string compute_event_hash(std::string_view previous_hash,
                                             std::string_view canonical_encoding);

// Builds a fully hashed event chained onto previous_hash.
// Throws std::invalid_argument under the same condition as canonical_event_encoding.
[[nodiscard]] SubmissionEvent make_event(std::string_view previous_hash, std::int64_t timestamp_ms,
                                         EventKind kind, std::optional<std::string> question_id,
                                         std::optional<std::string> payload);

// Recomputes the hash an event should carry when chained onto previous_hash.
// Uses the event's own timestamp, kind, question_id and payload; ignores its stored hashes.
[[nodiscard]] std::string recompute_event_hash(const SubmissionEvent& event,
                                               std::string_view previous_hash);

}  // namespace cedu::integrity
