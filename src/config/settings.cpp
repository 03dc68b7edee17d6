#include "cedu/config/settings.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace cedu::config {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

core::Result<bool, std::string> write_json_file(const fs::path& path, const json& j) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return core::Result<bool, std::string>::err("cannot open " + path.string() + " for writing");
  }
  out << j.dump(2);
  if (!out) {
    return core::Result<bool, std::string>::err("write failed: " + path.string());
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

Settings default_settings(const fs::path& base) {
  Settings s;
  s.base_path = base.string();
  s.student = StudentProfile{"student-id-placeholder", "Student Name", "class-placeholder"};
  s.model.path = (base / "runtime" / "model.gguf").string();
  return s;
}

fs::path default_base_path() {
  std::error_code ec;
  const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (!ec && exe.has_parent_path()) {
    return exe.parent_path() / "data";
  }
  const char* home = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe)
  const fs::path root = (home != nullptr && *home != '\0') ? fs::path(home) : fs::path(".");
  return root / kAppFolderName;
}

core::Result<bool, std::string> ensure_base_folders(const fs::path& base) {
  const std::vector<fs::path> dirs = {
      base,
      base / "homework",
      base / "homework" / "assigned",
      base / "homework" / "completed",
      base / "revision",
      base / "modules",
      base / "logs",
      base / "config",
      base / "runtime",
      base / "themes",
  };
  for (const auto& d : dirs) {
    std::error_code ec;
    fs::create_directories(d, ec);
    if (ec) {
      return core::Result<bool, std::string>::err("cannot create " + d.string() + ": " +
                                                  ec.message());
    }
  }
  return core::Result<bool, std::string>::ok(true);
}

fs::path settings_path(const fs::path& base) {
  return base / "config" / "settings.json";
}

json settings_to_json(const Settings& s) {
  json j;
  j["version"] = s.version;
  j["base_path"] = s.base_path;
  j["mode"] = s.mode;
  j["default_year_level"] = s.default_year_level;
  j["teacher_mode"] = s.teacher_mode;
  j["student"] = {
      {"student_id", s.student.student_id},
      {"student_name", s.student.student_name},
      {"class_id", s.student.class_id},
  };
  j["janet"] = {
      {"enabled", s.janet.enabled},
      {"block_swears", s.janet.block_swears},
      {"block_mature_topics", s.janet.block_mature_topics},
      {"fallback_message", s.janet.fallback_message},
  };
  j["model"] = {
      {"name", s.model.name},
      {"path", s.model.path},
      {"max_tokens", s.model.max_tokens},
  };
  j["voice"] = {{"enabled", s.voice.enabled}, {"engine", s.voice.engine}};
  j["game"] = {
      {"enabled", s.game.enabled},
      {"games_in_class_allowed", s.game.games_in_class_allowed},
      {"available_games", s.game.available_games},
  };
  return j;
}

Settings settings_from_json(const json& j) {
  Settings s;
  s.version = j.value("version", s.version);
  s.base_path = j.value("base_path", s.base_path);
  s.mode = j.value("mode", s.mode);
  s.default_year_level = j.value("default_year_level", s.default_year_level);
  s.teacher_mode = j.value("teacher_mode", s.teacher_mode);

  if (j.contains("student")) {
    const json& st = j.at("student");
    s.student.student_id = st.value("student_id", std::string{});
    s.student.student_name = st.value("student_name", std::string{});
    s.student.class_id = st.value("class_id", std::string{});
  }
  if (j.contains("janet")) {
    const json& jn = j.at("janet");
    s.janet.enabled = jn.value("enabled", s.janet.enabled);
    s.janet.block_swears = jn.value("block_swears", s.janet.block_swears);
    s.janet.block_mature_topics = jn.value("block_mature_topics", s.janet.block_mature_topics);
    s.janet.fallback_message = jn.value("fallback_message", s.janet.fallback_message);
  }
  if (j.contains("model")) {
    const json& m = j.at("model");
    s.model.name = m.value("name", s.model.name);
    s.model.path = m.value("path", s.model.path);
    s.model.max_tokens = m.value("max_tokens", s.model.max_tokens);
  }
  if (j.contains("voice")) {
    const json& v = j.at("voice");
    s.voice.enabled = v.value("enabled", s.voice.enabled);
    s.voice.engine = v.value("engine", s.voice.engine);
  }
  if (j.contains("game")) {
    const json& g = j.at("game");
    s.game.enabled = g.value("enabled", s.game.enabled);
    s.game.games_in_class_allowed = g.value("games_in_class_allowed", s.game.games_in_class_allowed);
    s.game.available_games = g.value("available_games", s.game.available_games);
  }
  return s;
}

core::Result<Settings, std::string> load_or_init_settings(const fs::path& base) {
  using R = core::Result<Settings, std::string>;
  const fs::path path = settings_path(base);

  std::error_code ec;
  if (fs::exists(path, ec)) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return R::err("cannot read " + path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    try {
      Settings s = settings_from_json(json::parse(contents.str()));
      s.base_path = base.string();
      return R::ok(std::move(s));
    } catch (const json::exception& e) {
      return R::err("settings parse error: " + std::string(e.what()));
    }
  }

  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return R::err("cannot create " + path.parent_path().string() + ": " + ec.message());
  }
  Settings s = default_settings(base);
  auto written = write_json_file(path, settings_to_json(s));
  if (!written.has_value()) {
    return R::err(written.error());
  }
  std::cerr << "[settings] Wrote default settings to " << path.string() << "\n";
  return R::ok(std::move(s));
}

core::Result<bool, std::string> save_settings(const Settings& settings, const fs::path& base) {
  std::error_code ec;
  fs::create_directories(settings_path(base).parent_path(), ec);
  if (ec) {
    return core::Result<bool, std::string>::err(ec.message());
  }
  return write_json_file(settings_path(base), settings_to_json(settings));
}

}  // namespace cedu::config
