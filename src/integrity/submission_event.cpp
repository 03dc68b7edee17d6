#include "cedu/integrity/submission_event.h"

#include <stdexcept>

namespace cedu::integrity {

std::string_view to_string(EventKind kind) {
  switch (kind) {
    case EventKind::kStart:
      return "start";
    case EventKind::kAnswer:
      return "answer";
    case EventKind::kFinalize:
      return "finalize";
  }
  return "start";  // unreachable: switch is exhaustive
}

std::optional<EventKind> parse_event_kind(std::string_view name) {
  if (name == "start") {
    return EventKind::kStart;
  }
  if (name == "answer") {
    return EventKind::kAnswer;
  }
  if (name == "finalize") {
    return EventKind::kFinalize;
  }
  return std::nullopt;
}

nlohmann::json event_to_json(const SubmissionEvent& event) {
  nlohmann::json j;
  j["t"] = event.timestamp_ms;
  j["type"] = std::string(to_string(event.kind));
  if (event.question_id.has_value()) {
    j["qid"] = event.question_id.value();
  }
  if (event.payload.has_value()) {
    j["payload"] = event.payload.value();
  }
  j["prev"] = event.previous_hash;
  j["hash"] = event.hash;
  return j;
}

SubmissionEvent event_from_json(const nlohmann::json& j) {
  SubmissionEvent event;
  event.timestamp_ms = j.at("t").get<std::int64_t>();

  const auto type_name = j.at("type").get<std::string>();
  const auto kind = parse_event_kind(type_name);
  if (!kind.has_value()) {
    throw std::invalid_argument("Unknown event type: " + type_name);
  }
  event.kind = kind.value();

  if (j.contains("qid") && !j.at("qid").is_null()) {
    event.question_id = j.at("qid").get<std::string>();
  }
  if (j.contains("payload") && !j.at("payload").is_null()) {
    event.payload = j.at("payload").get<std::string>();
  }
  event.previous_hash = j.at("prev").get<std::string>();
  event.hash = j.at("hash").get<std::string>();
  return event;
}

}  // namespace cedu::integrity
