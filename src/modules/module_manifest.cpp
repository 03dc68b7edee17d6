#include "cedu/modules/module_manifest.h"

#include "cedu/core/normalization.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <utility>

namespace cedu::modules {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

std::optional<std::string> optional_string_at(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

json optional_to_json(const std::optional<std::string>& value) {
  return value.has_value() ? json(value.value()) : json(nullptr);
}

ModuleEntry entry_from_json(const json& j) {
  const auto type = j.at("type").get<std::string>();
  if (type == "builtin_panel") {
    return BuiltinPanelEntry{j.at("target").get<std::string>()};
  }
  if (type == "markdown") {
    return MarkdownEntry{j.at("path").get<std::string>()};
  }
  if (type == "static_html") {
    return StaticHtmlEntry{j.at("path").get<std::string>()};
  }
  if (type == "external_process") {
    ExternalProcessEntry e;
    e.command = j.at("command").get<std::string>();
    if (j.contains("args")) {
      e.args = j.at("args").get<std::vector<std::string>>();
    }
    return e;
  }
  throw std::invalid_argument("Unknown module entry type: " + type);
}

json entry_to_json(const ModuleEntry& entry) {
  json j = std::visit(
      [](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BuiltinPanelEntry>) {
          return {{"target", e.target}};
        } else if constexpr (std::is_same_v<T, MarkdownEntry>) {
          return {{"path", e.path}};
        } else if constexpr (std::is_same_v<T, StaticHtmlEntry>) {
          return {{"path", e.path}};
        } else if constexpr (std::is_same_v<T, ExternalProcessEntry>) {
          return {{"command", e.command}, {"args", e.args}};
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled module entry kind");
        }
      },
      entry);
  j["type"] = entry_type_name(entry);
  return j;
}

core::Result<bool, std::string> ensure_builtin_homework_module(const fs::path& modules_root) {
  using R = core::Result<bool, std::string>;
  const fs::path folder = modules_root / "homework_dashboard";
  const fs::path manifest_path = folder / "module.json";

  std::error_code ec;
  if (fs::exists(manifest_path, ec)) {
    return R::ok(false);
  }
  fs::create_directories(folder, ec);
  if (ec) {
    return R::err("cannot create " + folder.string() + ": " + ec.message());
  }

  ModuleManifest manifest;
  manifest.id = "homework_dashboard";
  manifest.title = "Homework Dashboard";
  manifest.description = "Built-in view for packs and submissions";
  manifest.version = "1.0.0";
  manifest.author = "Chatty-EDU";
  manifest.entry = BuiltinPanelEntry{"homework_dashboard"};

  std::ofstream out(manifest_path, std::ios::binary | std::ios::trunc);
  out << manifest_to_json(manifest).dump(2);
  if (!out) {
    return R::err("write failed: " + manifest_path.string());
  }
  return R::ok(true);
}

}  // namespace

const char* entry_type_name(const ModuleEntry& entry) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BuiltinPanelEntry>) {
          return "builtin_panel";
        } else if constexpr (std::is_same_v<T, MarkdownEntry>) {
          return "markdown";
        } else if constexpr (std::is_same_v<T, StaticHtmlEntry>) {
          return "static_html";
        } else if constexpr (std::is_same_v<T, ExternalProcessEntry>) {
          return "external_process";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled module entry kind");
        }
      },
      entry);
}

std::string describe_entry(const ModuleEntry& entry) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BuiltinPanelEntry>) {
          return "panel " + e.target;
        } else if constexpr (std::is_same_v<T, MarkdownEntry>) {
          return "markdown " + e.path;
        } else if constexpr (std::is_same_v<T, StaticHtmlEntry>) {
          return "html " + e.path;
        } else if constexpr (std::is_same_v<T, ExternalProcessEntry>) {
          std::string line = "run " + e.command;
          for (const auto& arg : e.args) {
            line += " " + arg;
          }
          return line;
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled module entry kind");
        }
      },
      entry);
}

json manifest_to_json(const ModuleManifest& m) {
  json j;
  j["id"] = m.id;
  j["title"] = m.title;
  j["description"] = optional_to_json(m.description);
  j["version"] = optional_to_json(m.version);
  j["author"] = optional_to_json(m.author);
  j["roles"] = m.roles;
  j["entry"] = entry_to_json(m.entry);
  j["icon"] = optional_to_json(m.icon);
  j["permissions"] = m.permissions;
  return j;
}

ModuleManifest manifest_from_json(const json& j) {
  ModuleManifest m;
  m.id = j.at("id").get<std::string>();
  m.title = j.at("title").get<std::string>();
  m.description = optional_string_at(j, "description");
  m.version = optional_string_at(j, "version");
  m.author = optional_string_at(j, "author");
  if (j.contains("roles")) {
    m.roles = j.at("roles").get<std::vector<std::string>>();
  }
  m.entry = entry_from_json(j.at("entry"));
  m.icon = optional_string_at(j, "icon");
  if (j.contains("permissions")) {
    m.permissions = j.at("permissions").get<std::vector<std::string>>();
  }
  return m;
}

bool role_allowed(const ModuleManifest& manifest, const std::string& role) {
  return std::any_of(manifest.roles.begin(), manifest.roles.end(),
                     [&role](const std::string& r) { return core::iequals_ascii(r, role); });
}

core::Result<std::vector<LoadedModule>, std::string> load_modules(const fs::path& base) {
  using R = core::Result<std::vector<LoadedModule>, std::string>;
  const fs::path root = base / "modules";

  auto seeded = ensure_builtin_homework_module(root);
  if (!seeded.has_value()) {
    return R::err(seeded.error());
  }

  std::vector<LoadedModule> modules;
  std::error_code ec;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec)) {
      continue;
    }
    const fs::path manifest_path = it->path() / "module.json";
    if (!fs::exists(manifest_path, type_ec)) {
      std::cerr << "[modules] Skipping " << it->path().filename().string()
                << " (no module.json found)\n";
      continue;
    }

    std::ifstream in(manifest_path, std::ios::binary);
    if (!in) {
      std::cerr << "[modules] Could not read " << manifest_path.string() << "\n";
      continue;
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    try {
      modules.push_back({manifest_from_json(json::parse(contents.str())), it->path()});
    } catch (const json::exception& e) {
      std::cerr << "[modules] Invalid manifest in " << it->path().filename().string() << ": "
                << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[modules] Invalid manifest in " << it->path().filename().string() << ": "
                << e.what() << "\n";
    }
  }
  if (ec) {
    return R::err("cannot list " + root.string() + ": " + ec.message());
  }

  std::sort(modules.begin(), modules.end(), [](const LoadedModule& a, const LoadedModule& b) {
    return a.manifest.id < b.manifest.id;
  });
  return R::ok(std::move(modules));
}

}  // namespace cedu::modules
