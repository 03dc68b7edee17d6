#include "cedu/integrity/event_chain.h"

#include "cedu/core/sha256.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace cedu::integrity {

std::string canonical_event_encoding(std::int64_t timestamp_ms, EventKind kind,
                                     const std::optional<std::string>& question_id,
                                     const std::optional<std::string>& payload,
                                     std::string_view previous_hash) {
  // ordered_json keeps insertion order; the order below is part of the hash contract
  // and must never be changed, or every stored submission stops verifying.
  nlohmann::ordered_json j;
  j["t"] = timestamp_ms;
  j["type"] = std::string(to_string(kind));
  if (question_id.has_value()) {
    j["qid"] = question_id.value();
  }
  if (payload.has_value()) {
    j["payload"] = payload.value();
  }
  j["prev"] = std::string(previous_hash);

  // The strict handler is required: substituting invalid bytes would let distinct
  // payloads share an encoding.
  try {
    return j.dump();
  } catch (const nlohmann::ordered_json::type_error& e) {
    throw std::invalid_argument(std::string("event text is not valid UTF-8: ") + e.what());
  }
}

std::string compute_event_hash(std::string_view previous_hash,
                               std::string_view canonical_encoding) {
  core::Sha256 hasher;
  hasher.update(previous_hash);
  hasher.update(canonical_encoding);
  return hasher.hex_digest();
}

SubmissionEvent make_event(std::string_view previous_hash, std::int64_t timestamp_ms,
                           EventKind kind, std::optional<std::string> question_id,
                           std::optional<std::string> payload) {
  SubmissionEvent event;
  event.timestamp_ms = timestamp_ms;
  event.kind = kind;
  event.question_id = std::move(question_id);
  event.payload = std::move(payload);
  event.previous_hash = std::string(previous_hash);
  event.hash = recompute_event_hash(event, previous_hash);
  return event;
}

std::string recompute_event_hash(const SubmissionEvent& event, std::string_view previous_hash) {
  const std::string encoding = canonical_event_encoding(
      event.timestamp_ms, event.kind, event.question_id, event.payload, previous_hash);
  return compute_event_hash(previous_hash, encoding);
}

}  // namespace cedu::integrity
