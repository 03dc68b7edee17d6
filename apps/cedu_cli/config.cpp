#include "config.h"

#include <array>
#include <iostream>
#include <string_view>

namespace cedu::cli {

namespace {

constexpr std::array<std::string_view, 9> kCommands = {
    "submit",    "verify",      "summaries",   "pack-template", "pack-create",
    "pack-latest", "modules",   "ask",         "settings",
};

}  // namespace

CliConfig parse_global_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  CliConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--base-path") {
      if (i + 1 < argc) {
        config.base_path = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      } else {
        std::cerr << "Option --base-path requires a value\n";
        config.parse_ok = false;
      }
    } else if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      config.parse_ok = false;
    } else {
      config.command = arg;
      config.command_index = i;
      break;
    }
  }

  return config;
}

bool is_known_command(const std::string& command) {
  for (const auto known : kCommands) {
    if (known == command) {
      return true;
    }
  }
  return false;
}

void print_usage() {
  std::cout << "Usage: cedu_cli [--base-path <dir>] <command> [options]\n"
               "\n"
               "Commands:\n"
               "  submit --assignment <id> --answer <text> [--attachment <path>]... "
               "[--no-overwrite]\n"
               "  verify [--file <path>]\n"
               "  summaries\n"
               "  pack-template\n"
               "  pack-create --assignment <id> [--title <text>] [--class <id>]\n"
               "  pack-latest\n"
               "  modules [--role <role>]\n"
               "  ask <text>\n"
               "  settings\n"
               "\n"
               "The data directory defaults to ./data next to the executable.\n";
}

}  // namespace cedu::cli
