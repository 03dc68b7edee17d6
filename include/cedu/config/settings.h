#pragma once

#include "cedu/core/result.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cedu::config {

inline constexpr const char* kAppFolderName = "Chatty-EDU";

// Safety filter ("Janet") switches.
struct JanetConfig {
  bool enabled{true};                  // NOLINT(readability-identifier-naming)
  bool block_swears{true};             // NOLINT(readability-identifier-naming)
  bool block_mature_topics{true};      // NOLINT(readability-identifier-naming)
  std::string fallback_message{"Let's ask a teacher or parent about that one."};  // NOLINT
};

struct ModelConfig {
  std::string name{"phi-mini-placeholder"};  // NOLINT(readability-identifier-naming)
  std::string path;                          // NOLINT(readability-identifier-naming)
  std::uint32_t max_tokens{256};             // NOLINT(readability-identifier-naming)
};

struct VoiceConfig {
  bool enabled{false};         // NOLINT(readability-identifier-naming)
  std::string engine{"os_tts"};  // NOLINT(readability-identifier-naming)
};

struct GameConfig {
  bool enabled{true};                    // NOLINT(readability-identifier-naming)
  bool games_in_class_allowed{false};    // NOLINT(readability-identifier-naming)
  std::vector<std::string> available_games{"chattybox", "chattyclysm"};  // NOLINT
};

// Blank fields are replaced with defaults when a submission is built.
struct StudentProfile {
  std::string student_id;    // NOLINT(readability-identifier-naming)
  std::string student_name;  // NOLINT(readability-identifier-naming)
  std::string class_id;      // NOLINT(readability-identifier-naming)
};

struct Settings {
  std::string version{"0.2.0"};              // NOLINT(readability-identifier-naming)
  std::string base_path;                     // NOLINT(readability-identifier-naming)
  std::string mode{"cli"};                   // NOLINT(readability-identifier-naming)
  std::string default_year_level{"year_3"};  // NOLINT(readability-identifier-naming)
  std::string teacher_mode{"class"};         // "class" | "free_time"
  StudentProfile student;                    // NOLINT(readability-identifier-naming)
  JanetConfig janet;                         // NOLINT(readability-identifier-naming)
  ModelConfig model;                         // NOLINT(readability-identifier-naming)
  VoiceConfig voice;                         // NOLINT(readability-identifier-naming)
  GameConfig game;                           // NOLINT(readability-identifier-naming)
};

// Settings written on first run for a data directory rooted at base.
[[nodiscard]] Settings default_settings(const std::filesystem::path& base);

// <exe dir>/data, or $HOME/Chatty-EDU when the executable path is unavailable.
[[nodiscard]] std::filesystem::path default_base_path();

// Creates the data directory layout under base (idempotent).
[[nodiscard]] core::Result<bool, std::string> ensure_base_folders(const std::filesystem::path& base);

// <base>/config/settings.json
[[nodiscard]] std::filesystem::path settings_path(const std::filesystem::path& base);

// Reads settings.json, or writes and returns defaults when it does not exist yet.
// base_path is always re-synced to base.
[[nodiscard]] core::Result<Settings, std::string> load_or_init_settings(
    const std::filesystem::path& base);

[[nodiscard]] core::Result<bool, std::string> save_settings(const Settings& settings,
                                                            const std::filesystem::path& base);

[[nodiscard]] nlohmann::json settings_to_json(const Settings& settings);

// Missing sections fall back to defaults. Throws nlohmann::json::exception on type mismatches.
[[nodiscard]] Settings settings_from_json(const nlohmann::json& j);

}  // namespace cedu::config
