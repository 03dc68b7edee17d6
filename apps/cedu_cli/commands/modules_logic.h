#pragma once

#include "cedu/modules/module_manifest.h"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

void print_modules(const std::vector<cedu::modules::LoadedModule>& modules,
                   const std::optional<std::string>& role, std::ostream& out);

int execute_modules(const std::filesystem::path& base, const std::optional<std::string>& role,
                    std::ostream& out);
