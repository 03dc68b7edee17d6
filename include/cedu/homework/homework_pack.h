#pragma once

#include "cedu/config/settings.h"
#include "cedu/core/clock.h"
#include "cedu/core/result.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cedu::homework {

struct HomeworkAssignment {
  std::string id;                        // NOLINT(readability-identifier-naming)
  std::string title;                     // NOLINT(readability-identifier-naming)
  std::string subject;                   // NOLINT(readability-identifier-naming)
  std::string year_level;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> due_at;     // NOLINT(readability-identifier-naming)
  std::string instructions_md;           // NOLINT(readability-identifier-naming)
  std::vector<std::string> attachments;  // NOLINT(readability-identifier-naming)
  bool allow_games{false};               // NOLINT(readability-identifier-naming)
  bool allow_ai_premark{false};          // NOLINT(readability-identifier-naming)
  std::optional<int> max_score;          // NOLINT(readability-identifier-naming)

  bool operator==(const HomeworkAssignment&) const = default;
};

// Teacher-authored bundle of assignments. Written once, never edited in place.
struct HomeworkPack {
  std::string version;                          // NOLINT(readability-identifier-naming)
  std::string school_id;                        // NOLINT(readability-identifier-naming)
  std::string class_id;                         // NOLINT(readability-identifier-naming)
  std::string created_at;                       // RFC 3339
  std::vector<HomeworkAssignment> assignments;  // NOLINT(readability-identifier-naming)

  bool operator==(const HomeworkPack&) const = default;
};

struct LocatedPack {
  std::filesystem::path path;  // NOLINT(readability-identifier-naming)
  HomeworkPack pack;           // NOLINT(readability-identifier-naming)
};

using PackResult = core::Result<std::filesystem::path, std::string>;

[[nodiscard]] nlohmann::json pack_to_json(const HomeworkPack& pack);

// attachments, allow_games and allow_ai_premark default when absent.
// Throws nlohmann::json::exception on missing required fields or type mismatches.
[[nodiscard]] HomeworkPack pack_from_json(const nlohmann::json& j);

// <base>/homework/assigned
[[nodiscard]] std::filesystem::path assigned_dir_for(const std::filesystem::path& base);

// Name-based filter: a *.json file whose name contains "homework_pack".
[[nodiscard]] bool is_pack_file_name(const std::filesystem::path& path);

// Writes a one-assignment sample pack to assigned/homework_pack_template.json.
[[nodiscard]] PackResult export_pack_template(const std::filesystem::path& base,
                                              const std::string& school_id,
                                              const std::string& class_id, core::IClock& clock);

// Writes assigned/homework_pack_<class_id>_<created_at with ':' replaced by '-'>.json.
// An empty assignment list is rejected.
[[nodiscard]] PackResult create_pack(const std::filesystem::path& base,
                                     const std::string& school_id, const std::string& class_id,
                                     std::vector<HomeworkAssignment> assignments,
                                     core::IClock& clock);

[[nodiscard]] core::Result<HomeworkPack, std::string> load_pack_from_file(
    const std::filesystem::path& path);

// Newest pack in assigned/, ranked by created_at (falling back to the file's
// modification time when created_at is not RFC 3339). On equal rank the first
// file in name order wins. Unparsable pack files are logged and skipped.
// Returns nullopt when there is no usable pack.
[[nodiscard]] std::optional<LocatedPack> find_latest_pack(const std::filesystem::path& base);

// Any assignment that disallows games switches games off, in class and out.
void apply_pack_policy(config::Settings& settings, const HomeworkPack& pack);

}  // namespace cedu::homework
