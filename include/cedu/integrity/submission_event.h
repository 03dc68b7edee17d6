#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cedu::integrity {

// Lifecycle stage an event records.
enum class EventKind {
  kStart,     // NOLINT(readability-identifier-naming)
  kAnswer,    // NOLINT(readability-identifier-naming)
  kFinalize,  // NOLINT(readability-identifier-naming)
};

// Wire names: "start", "answer", "finalize".
[[nodiscard]] std::string_view to_string(EventKind kind);
[[nodiscard]] std::optional<EventKind> parse_event_kind(std::string_view name);

// One append-only, hash-committed fact in a submission's history.
// hash is computed by make_event(); callers never fill it in by hand.
struct SubmissionEvent {
  std::int64_t timestamp_ms{0};            // NOLINT(readability-identifier-naming)
  EventKind kind{EventKind::kStart};       // NOLINT(readability-identifier-naming)
  std::optional<std::string> question_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> payload;      // NOLINT(readability-identifier-naming)
  std::string previous_hash;               // NOLINT(readability-identifier-naming)
  std::string hash;                        // NOLINT(readability-identifier-naming)

  bool operator==(const SubmissionEvent&) const = default;
};

// On-disk form: {"hash", "payload"?, "prev", "qid"?, "t", "type"}.
// Absent optionals are omitted rather than written as null.
[[nodiscard]] nlohmann::json event_to_json(const SubmissionEvent& event);

// Throws nlohmann::json::exception on missing fields or type mismatches and
// std::invalid_argument on an unknown event type.
// Unknown types are rejected rather than carried through: the verifier only knows
// how to encode the kinds above, so a file holding any other kind is unreadable and
// load_all skips it whole. Adding a kind means extending EventKind, its wire names
// and the lifecycle check together.
[[nodiscard]] SubmissionEvent event_from_json(const nlohmann::json& j);

}  // namespace cedu::integrity
