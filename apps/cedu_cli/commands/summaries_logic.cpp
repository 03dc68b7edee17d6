#include "summaries_logic.h"


namespace {

constexpr std::size_t kStudentWidth = 14;
constexpr std::size_t kAssignmentWidth = 18;
constexpr std::size_t kScoreWidth = 6;
constexpr std::size_t kIntegrityWidth = 13;
constexpr const char* kEllipsis = "\xE2\x80\xA6";

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

std::size_t count_code_points(std::string_view text) {
  std::size_t n = 0;
  for (const char ch : text) {
    if (!is_continuation_byte(ch)) {
      ++n;
    }
  }
  return n;
}

// Left-aligns by code point so multi-byte names line up.
std::string pad(std::string_view text, std::size_t width) {
  std::string out(text);
  const auto used = count_code_points(text);
  if (used < width) {
    out.append(width - used, ' ');
  }
  return out;
}

}  // namespace

std::vector<DashboardRow> build_dashboard(const cedu::homework::ISubmissionStore& store) {
  std::vector<DashboardRow> rows;
  for (const auto& record : store.load_all()) {
    rows.push_back(
        {cedu::homework::summarize(record), cedu::homework::verify_submission(record).has_value()});
  }
  return rows;
}

std::string truncate_for_table(std::string_view text, std::size_t max_chars) {
  if (max_chars == 0) {
    return "";
  }
  if (count_code_points(text) <= max_chars) {
    return std::string(text);
  }

  std::string out;
  std::size_t kept = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (!is_continuation_byte(text[i])) {
      if (kept == max_chars - 1) {
        break;
      }
      ++kept;
    }
    out.push_back(text[i]);
  }
  out += kEllipsis;
  return out;
}

void print_dashboard(const std::vector<DashboardRow>& rows, std::ostream& out) {
  if (rows.empty()) {
    out << "No completed homework found yet.\n";
    return;
  }

  out << pad("Student", kStudentWidth) << " | " << pad("Assignment", kAssignmentWidth) << " | "
      << pad("Score", kScoreWidth) << " | " << pad("Integrity", kIntegrityWidth) << " | "
      << "Submitted\n";
  out << std::string(80, '-') << "\n";

  for (const auto& row : rows) {
    const auto& s = row.summary;
    const std::string score = s.score.has_value() ? std::to_string(s.score.value()) : "-";
    out << pad(truncate_for_table(s.student_name, kStudentWidth), kStudentWidth) << " | "
        << pad(truncate_for_table(s.assignment_id, kAssignmentWidth), kAssignmentWidth) << " | "
        << pad(score, kScoreWidth) << " | "
        << pad(row.intact ? "ok" : "looks altered", kIntegrityWidth) << " | " << s.submitted_at
        << "\n";
  }
}

int execute_summaries(const cedu::homework::ISubmissionStore& store, std::ostream& out) {
  print_dashboard(build_dashboard(store), out);
  return 0;
}
