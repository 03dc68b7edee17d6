#pragma once

#include "cedu/core/result.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cedu::modules {

// One case per way a module can be opened. Stored as {"type": "<snake_case>", ...}.
struct BuiltinPanelEntry {
  std::string target;  // NOLINT(readability-identifier-naming)
  bool operator==(const BuiltinPanelEntry&) const = default;
};

struct MarkdownEntry {
  std::string path;  // NOLINT(readability-identifier-naming)
  bool operator==(const MarkdownEntry&) const = default;
};

struct StaticHtmlEntry {
  std::string path;  // NOLINT(readability-identifier-naming)
  bool operator==(const StaticHtmlEntry&) const = default;
};

struct ExternalProcessEntry {
  std::string command;            // NOLINT(readability-identifier-naming)
  std::vector<std::string> args;  // NOLINT(readability-identifier-naming)
  bool operator==(const ExternalProcessEntry&) const = default;
};

using ModuleEntry =
    std::variant<BuiltinPanelEntry, MarkdownEntry, StaticHtmlEntry, ExternalProcessEntry>;

struct ModuleManifest {
  std::string id;                                          // NOLINT(readability-identifier-naming)
  std::string title;                                       // NOLINT(readability-identifier-naming)
  std::optional<std::string> description;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> version;                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> author;                       // NOLINT(readability-identifier-naming)
  std::vector<std::string> roles{"teacher", "student"};    // NOLINT(readability-identifier-naming)
  ModuleEntry entry;                                       // NOLINT(readability-identifier-naming)
  std::optional<std::string> icon;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> permissions;                    // NOLINT(readability-identifier-naming)

  bool operator==(const ModuleManifest&) const = default;
};

struct LoadedModule {
  ModuleManifest manifest;        // NOLINT(readability-identifier-naming)
  std::filesystem::path folder;   // NOLINT(readability-identifier-naming)
};

// "builtin_panel", "markdown", "static_html" or "external_process".
[[nodiscard]] const char* entry_type_name(const ModuleEntry& entry);

// Human-readable one-liner such as "panel homework_dashboard" or "run ./quiz --easy".
[[nodiscard]] std::string describe_entry(const ModuleEntry& entry);

[[nodiscard]] nlohmann::json manifest_to_json(const ModuleManifest& manifest);

// Throws nlohmann::json::exception on missing fields and std::invalid_argument
// on an unknown entry type.
[[nodiscard]] ModuleManifest manifest_from_json(const nlohmann::json& j);

// Case-insensitive role membership.
[[nodiscard]] bool role_allowed(const ModuleManifest& manifest, const std::string& role);

// Seeds modules/homework_dashboard/module.json when missing, then loads every
// modules/<dir>/module.json. Folders without a manifest, or with an invalid one,
// are logged and skipped. Result is sorted by manifest id.
[[nodiscard]] core::Result<std::vector<LoadedModule>, std::string> load_modules(
    const std::filesystem::path& base);

}  // namespace cedu::modules
