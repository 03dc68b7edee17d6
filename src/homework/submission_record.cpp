#include "cedu/homework/submission_record.h"

#include "cedu/core/version.h"

#include <utility>

namespace cedu::homework {

namespace {

using json = nlohmann::json;

json optional_to_json(const std::optional<std::string>& value) {
  return value.has_value() ? json(value.value()) : json(nullptr);
}

std::optional<std::string> optional_string_at(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

}  // namespace

SubmissionSummary summarize(const SubmissionRecord& record) {
  SubmissionSummary summary;
  summary.assignment_id = record.assignment_id;
  summary.student_id = record.student_id;
  summary.student_name = record.student_name;
  summary.submitted_at = record.submitted_at;
  if (record.ai_premark.has_value()) {
    summary.score = record.ai_premark->score;
    summary.feedback = record.ai_premark->feedback;
  }
  return summary;
}

integrity::ChainVerification verify_submission(const SubmissionRecord& record) {
  return integrity::verify_event_chain(record.events, record.final_hash);
}

json submission_to_json(const SubmissionRecord& record) {
  json answers = json::array();
  for (const auto& a : record.answers) {
    answers.push_back({{"question", a.question}, {"response", a.response}});
  }

  json events = json::array();
  for (const auto& ev : record.events) {
    events.push_back(integrity::event_to_json(ev));
  }

  json j;
  j["version"] = record.version;
  j["school_id"] = record.school_id;
  j["class_id"] = record.class_id;
  j["assignment_id"] = record.assignment_id;
  j["student_id"] = record.student_id;
  j["student_name"] = record.student_name;
  j["submitted_at"] = record.submitted_at;
  j["answers_text"] = optional_to_json(record.answers_text);
  j["answers"] = std::move(answers);
  if (record.ai_premark.has_value()) {
    const Premark& p = record.ai_premark.value();
    j["ai_premark"] = {
        {"score", p.score.has_value() ? json(p.score.value()) : json(nullptr)},
        {"feedback", optional_to_json(p.feedback)},
    };
  } else {
    j["ai_premark"] = nullptr;
  }
  j["attachments"] = record.attachments;
  j["events"] = std::move(events);
  j["final_hash"] = optional_to_json(record.final_hash);
  j["summary"] = optional_to_json(record.summary);
  return j;
}

SubmissionRecord submission_from_json(const json& j) {
  SubmissionRecord record;
  record.version = j.value("version", std::string(core::kDocumentVersion));
  record.school_id = j.at("school_id").get<std::string>();
  record.class_id = j.at("class_id").get<std::string>();
  record.assignment_id = j.at("assignment_id").get<std::string>();
  record.student_id = j.at("student_id").get<std::string>();
  record.student_name = j.at("student_name").get<std::string>();
  record.submitted_at = j.at("submitted_at").get<std::string>();
  record.answers_text = optional_string_at(j, "answers_text");

  if (j.contains("answers") && !j.at("answers").is_null()) {
    for (const auto& a : j.at("answers")) {
      record.answers.push_back(
          {a.at("question").get<std::string>(), a.at("response").get<std::string>()});
    }
  }

  if (j.contains("ai_premark") && !j.at("ai_premark").is_null()) {
    const json& p = j.at("ai_premark");
    Premark premark;
    if (p.contains("score") && !p.at("score").is_null()) {
      premark.score = p.at("score").get<int>();
    }
    premark.feedback = optional_string_at(p, "feedback");
    record.ai_premark = std::move(premark);
  }

  if (j.contains("attachments") && !j.at("attachments").is_null()) {
    record.attachments = j.at("attachments").get<std::vector<std::string>>();
  }

  if (j.contains("events") && !j.at("events").is_null()) {
    for (const auto& ev : j.at("events")) {
      record.events.push_back(integrity::event_from_json(ev));
    }
  }

  record.final_hash = optional_string_at(j, "final_hash");
  record.summary = optional_string_at(j, "summary");
  return record;
}

}  // namespace cedu::homework
