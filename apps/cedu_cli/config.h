#pragma once

#include <optional>
#include <string>

namespace cedu::cli {

// CliConfig holds the flags that precede the subcommand.
// Subcommand flags are parsed by each command with apps::parse_options.
struct CliConfig {
  std::optional<std::string> base_path;  // NOLINT(readability-identifier-naming)
  std::string command;                   // NOLINT(readability-identifier-naming)
  int command_index{0};                  // argv index of command; 0 when absent
  bool show_help{false};                 // NOLINT(readability-identifier-naming)
  bool parse_ok{true};                   // NOLINT(readability-identifier-naming)
};

// Stops at the first non-flag token, which becomes the subcommand.
CliConfig parse_global_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

[[nodiscard]] bool is_known_command(const std::string& command);

void print_usage();

}  // namespace cedu::cli
