#include "cedu/config/settings.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "test_support.h"

using namespace cedu::config;

TEST_CASE("ensure_base_folders: creates the data layout and is idempotent", "[settings]") {
  ScopedTempDir tmp("settings_folders");
  REQUIRE(ensure_base_folders(tmp.path).has_value());
  REQUIRE(ensure_base_folders(tmp.path).has_value());

  CHECK(std::filesystem::is_directory(tmp.path / "homework" / "assigned"));
  CHECK(std::filesystem::is_directory(tmp.path / "homework" / "completed"));
  CHECK(std::filesystem::is_directory(tmp.path / "modules"));
  CHECK(std::filesystem::is_directory(tmp.path / "config"));
}

TEST_CASE("load_or_init_settings: first run writes defaults", "[settings]") {
  ScopedTempDir tmp("settings_init");
  const auto loaded = load_or_init_settings(tmp.path);
  REQUIRE(loaded.has_value());
  CHECK(std::filesystem::exists(settings_path(tmp.path)));
  CHECK(loaded.value().base_path == tmp.path.string());
  CHECK(loaded.value().janet.enabled);
  CHECK(loaded.value().model.path == (tmp.path / "runtime" / "model.gguf").string());
}

TEST_CASE("load_or_init_settings: saved values survive and base_path is re-synced",
          "[settings]") {
  ScopedTempDir tmp("settings_reload");
  Settings s = default_settings("/somewhere/else");
  s.student.student_id = "s1";
  s.janet.block_swears = false;
  s.model.max_tokens = 64;
  REQUIRE(save_settings(s, tmp.path).has_value());

  const auto loaded = load_or_init_settings(tmp.path);
  REQUIRE(loaded.has_value());
  CHECK(loaded.value().student.student_id == "s1");
  CHECK_FALSE(loaded.value().janet.block_swears);
  CHECK(loaded.value().model.max_tokens == 64);
  CHECK(loaded.value().base_path == tmp.path.string());
}

TEST_CASE("settings_from_json: missing sections fall back to defaults", "[settings]") {
  const auto s = settings_from_json(nlohmann::json::parse(R"({"mode":"gui"})"));
  CHECK(s.mode == "gui");
  CHECK(s.janet.enabled);
  CHECK(s.janet.fallback_message == "Let's ask a teacher or parent about that one.");
  CHECK(s.model.max_tokens == 256);
  CHECK(s.game.available_games == std::vector<std::string>{"chattybox", "chattyclysm"});
}

TEST_CASE("load_or_init_settings: corrupt file is an error, not a reset", "[settings]") {
  ScopedTempDir tmp("settings_corrupt");
  write_text_file(settings_path(tmp.path), "{ nope");
  const auto loaded = load_or_init_settings(tmp.path);
  REQUIRE_FALSE(loaded.has_value());
  CHECK(read_text_file(settings_path(tmp.path)) == "{ nope");
}
