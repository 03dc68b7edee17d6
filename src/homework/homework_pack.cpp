#include "cedu/homework/homework_pack.h"

#include "cedu/core/time.h"
#include "cedu/core/version.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace cedu::homework {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

PackResult write_pack(const fs::path& dir, const std::string& file_name, const HomeworkPack& pack) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return PackResult::err("cannot create " + dir.string() + ": " + ec.message());
  }
  const fs::path path = dir / file_name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return PackResult::err("cannot open " + path.string() + " for writing");
  }
  out << pack_to_json(pack).dump(2);
  if (!out) {
    return PackResult::err("write failed: " + path.string());
  }
  return PackResult::ok(path);
}

std::int64_t file_mtime_millis(const fs::path& path) {
  std::error_code ec;
  const auto ftime = fs::last_write_time(path, ec);
  if (ec) {
    return 0;
  }
  const auto sys = std::chrono::file_clock::to_sys(ftime);
  return core::to_unix_millis(std::chrono::time_point_cast<core::Clock::duration>(sys));
}

}  // namespace

json pack_to_json(const HomeworkPack& pack) {
  json assignments = json::array();
  for (const auto& a : pack.assignments) {
    json entry;
    entry["id"] = a.id;
    entry["title"] = a.title;
    entry["subject"] = a.subject;
    entry["year_level"] = a.year_level;
    entry["due_at"] = a.due_at.has_value() ? json(a.due_at.value()) : json(nullptr);
    entry["instructions_md"] = a.instructions_md;
    entry["attachments"] = a.attachments;
    entry["allow_games"] = a.allow_games;
    entry["allow_ai_premark"] = a.allow_ai_premark;
    entry["max_score"] = a.max_score.has_value() ? json(a.max_score.value()) : json(nullptr);
    assignments.push_back(std::move(entry));
  }

  json j;
  j["version"] = pack.version;
  j["school_id"] = pack.school_id;
  j["class_id"] = pack.class_id;
  j["created_at"] = pack.created_at;
  j["assignments"] = std::move(assignments);
  return j;
}

HomeworkPack pack_from_json(const json& j) {
  HomeworkPack pack;
  pack.version = j.at("version").get<std::string>();
  pack.school_id = j.at("school_id").get<std::string>();
  pack.class_id = j.at("class_id").get<std::string>();
  pack.created_at = j.at("created_at").get<std::string>();

  for (const auto& entry : j.at("assignments")) {
    HomeworkAssignment a;
    a.id = entry.at("id").get<std::string>();
    a.title = entry.at("title").get<std::string>();
    a.subject = entry.at("subject").get<std::string>();
    a.year_level = entry.at("year_level").get<std::string>();
    if (entry.contains("due_at") && !entry.at("due_at").is_null()) {
      a.due_at = entry.at("due_at").get<std::string>();
    }
    a.instructions_md = entry.at("instructions_md").get<std::string>();
    if (entry.contains("attachments")) {
      a.attachments = entry.at("attachments").get<std::vector<std::string>>();
    }
    a.allow_games = entry.value("allow_games", false);
    a.allow_ai_premark = entry.value("allow_ai_premark", false);
    if (entry.contains("max_score") && !entry.at("max_score").is_null()) {
      a.max_score = entry.at("max_score").get<int>();
    }
    pack.assignments.push_back(std::move(a));
  }
  return pack;
}

fs::path assigned_dir_for(const fs::path& base) {
  return base / "homework" / "assigned";
}

bool is_pack_file_name(const fs::path& path) {
  return path.extension() == ".json" &&
         path.filename().string().find("homework_pack") != std::string::npos;
}

PackResult export_pack_template(const fs::path& base, const std::string& school_id,
                                const std::string& class_id, core::IClock& clock) {
  HomeworkAssignment sample;
  sample.id = "hw-sample-001";
  sample.title = "Sample homework";
  sample.subject = "General";
  sample.year_level = "7";
  sample.instructions_md = "Add your instructions here.\n- Question 1\n- Question 2";
  sample.allow_games = false;
  sample.allow_ai_premark = true;
  sample.max_score = 100;

  const HomeworkPack pack{core::kDocumentVersion, school_id, class_id, clock.now_iso8601(),
                          {sample}};
  return write_pack(assigned_dir_for(base), "homework_pack_template.json", pack);
}

PackResult create_pack(const fs::path& base, const std::string& school_id,
                       const std::string& class_id, std::vector<HomeworkAssignment> assignments,
                       core::IClock& clock) {
  if (assignments.empty()) {
    return PackResult::err("No assignments added.");
  }

  HomeworkPack pack{core::kDocumentVersion, school_id, class_id, clock.now_iso8601(),
                    std::move(assignments)};

  std::string stamp = pack.created_at;
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  const std::string file_name = "homework_pack_" + class_id + "_" + stamp + ".json";
  return write_pack(assigned_dir_for(base), file_name, pack);
}

core::Result<HomeworkPack, std::string> load_pack_from_file(const fs::path& path) {
  using R = core::Result<HomeworkPack, std::string>;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return R::err("cannot read " + path.string());
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  try {
    return R::ok(pack_from_json(json::parse(contents.str())));
  } catch (const json::exception& e) {
    return R::err("pack parse error: " + std::string(e.what()));
  }
}

std::optional<LocatedPack> find_latest_pack(const fs::path& base) {
  const fs::path dir = assigned_dir_for(base);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::nullopt;
  }

  std::vector<fs::path> candidates;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && is_pack_file_name(it->path())) {
      candidates.push_back(it->path());
    }
  }
  std::sort(candidates.begin(), candidates.end());

  std::optional<LocatedPack> newest;
  std::int64_t newest_ts = 0;
  for (const auto& path : candidates) {
    auto loaded = load_pack_from_file(path);
    if (!loaded.has_value()) {
      std::cerr << "[packs] WARNING: skipping " << path.filename().string() << ": "
                << loaded.error() << "\n";
      continue;
    }
    const std::int64_t ts =
        core::parse_rfc3339_millis(loaded.value().created_at).value_or(file_mtime_millis(path));
    if (!newest.has_value() || ts > newest_ts) {
      newest = LocatedPack{path, std::move(loaded.value())};
      newest_ts = ts;
    }
  }
  return newest;
}

void apply_pack_policy(config::Settings& settings, const HomeworkPack& pack) {
  const bool any_disallowed = std::any_of(pack.assignments.begin(), pack.assignments.end(),
                                          [](const HomeworkAssignment& a) { return !a.allow_games; });
  if (any_disallowed) {
    settings.game.enabled = false;
    settings.game.games_in_class_allowed = false;
  }
}

}  // namespace cedu::homework
