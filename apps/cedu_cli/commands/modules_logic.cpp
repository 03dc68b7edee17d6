#include "modules_logic.h"

#include <cstddef>
#include <iostream>

void print_modules(const std::vector<cedu::modules::LoadedModule>& modules,
                   const std::optional<std::string>& role, std::ostream& out) {
  std::size_t shown = 0;
  for (const auto& loaded : modules) {
    const auto& m = loaded.manifest;
    if (role.has_value() && !cedu::modules::role_allowed(m, role.value())) {
      continue;
    }
    ++shown;
    out << m.id << "  " << m.title;
    if (m.version.has_value()) {
      out << " v" << m.version.value();
    }
    out << "\n    " << cedu::modules::describe_entry(m.entry) << "\n";
    if (m.description.has_value()) {
      out << "    " << m.description.value() << "\n";
    }
  }
  if (shown == 0) {
    out << "No modules available" << (role.has_value() ? " for role " + role.value() : "")
        << ".\n";
  }
}

int execute_modules(const std::filesystem::path& base, const std::optional<std::string>& role,
                    std::ostream& out) {
  auto loaded = cedu::modules::load_modules(base);
  if (!loaded.has_value()) {
    std::cerr << "Failed to load modules: " << loaded.error() << "\n";
    return 1;
  }
  print_modules(loaded.value(), role, out);
  return 0;
}
