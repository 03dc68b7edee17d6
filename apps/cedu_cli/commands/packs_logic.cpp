#include "packs_logic.h"

#include <iostream>
#include <vector>

namespace {

constexpr const char* kSchoolId = "school";

std::string class_or_default(const std::string& class_id) {
  return class_id.empty() ? std::string("class") : class_id;
}

}  // namespace

int execute_pack_template(const std::filesystem::path& base, const cedu::config::Settings& settings,
                          cedu::core::IClock& clock, std::ostream& out) {
  auto written = cedu::homework::export_pack_template(
      base, kSchoolId, class_or_default(settings.student.class_id), clock);
  if (!written.has_value()) {
    std::cerr << "Failed to write template: " << written.error() << "\n";
    return 1;
  }
  out << "Pack template written to " << written.value().string() << "\n";
  return 0;
}

int execute_pack_create(const std::filesystem::path& base, const std::string& class_id,
                        const cedu::homework::HomeworkAssignment& assignment,
                        cedu::core::IClock& clock, std::ostream& out) {
  auto written = cedu::homework::create_pack(base, kSchoolId, class_or_default(class_id),
                                             std::vector{assignment}, clock);
  if (!written.has_value()) {
    std::cerr << "Failed to write pack: " << written.error() << "\n";
    return 1;
  }
  out << "Pack written to " << written.value().string() << "\n";
  return 0;
}

int execute_pack_latest(const std::filesystem::path& base, std::ostream& out) {
  const auto latest = cedu::homework::find_latest_pack(base);
  if (!latest.has_value()) {
    out << "No homework pack found in " << cedu::homework::assigned_dir_for(base).string()
        << "\n";
    return 0;
  }

  const auto& pack = latest->pack;
  out << "Latest pack: " << latest->path.string() << "\n";
  out << "  Class: " << pack.class_id << "  Created: " << pack.created_at << "\n";
  for (const auto& a : pack.assignments) {
    out << "  - " << a.id << ": " << a.title;
    if (a.due_at.has_value()) {
      out << " (due " << a.due_at.value() << ")";
    }
    out << (a.allow_games ? "" : " [no games]") << "\n";
  }
  return 0;
}
