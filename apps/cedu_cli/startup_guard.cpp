#include "startup_guard.h"

#include <filesystem>
#include <system_error>

namespace cedu::cli {

std::string validate_cli_config(const CliConfig& config) {
  if (!config.parse_ok) {
    return "Error: invalid global options.\n"
           "       Run cedu_cli --help for usage.";
  }

  if (config.command.empty()) {
    return "Error: no command given.\n"
           "       Run cedu_cli --help for the list of commands.";
  }

  if (!is_known_command(config.command)) {
    return "Error: unknown command '" + config.command +
           "'.\n"
           "       Run cedu_cli --help for the list of commands.";
  }

  if (config.base_path.has_value()) {
    const auto& base = config.base_path.value();
    if (base.empty()) {
      return "Error: --base-path must not be empty.";
    }
    std::error_code ec;
    const auto status = std::filesystem::status(base, ec);
    if (!ec && std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
      return "Error: --base-path '" + base + "' exists and is not a directory.";
    }
  }

  return "";
}

}  // namespace cedu::cli
