#include "cedu/config/settings.h"
#include "cedu/core/version.h"
#include "cedu/homework/homework_pack.h"

#include "commands/app_context.h"
#include "commands/ask.h"
#include "commands/modules.h"
#include "commands/packs.h"
#include "commands/settings_cmd.h"
#include "commands/submit.h"
#include "commands/summaries.h"
#include "commands/verify.h"
#include "config.h"
#include "startup_guard.h"

#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  const auto config = cedu::cli::parse_global_args(argc, argv);

  if (config.show_help) {
    cedu::cli::print_usage();
    return 0;
  }

  const auto guard_error = cedu::cli::validate_cli_config(config);
  if (!guard_error.empty()) {
    std::cerr << guard_error << "\n";
    return 1;
  }

  AppContext ctx;
  ctx.base = config.base_path.has_value() ? std::filesystem::path(config.base_path.value())
                                          : cedu::config::default_base_path();

  auto folders = cedu::config::ensure_base_folders(ctx.base);
  if (!folders.has_value()) {
    std::cerr << "Failed to create base folders at " << ctx.base.string() << ": "
              << folders.error() << "\n";
    return 1;
  }

  auto settings = cedu::config::load_or_init_settings(ctx.base);
  if (!settings.has_value()) {
    std::cerr << "Failed to load settings: " << settings.error() << "\n";
    return 1;
  }
  ctx.settings = settings.value();

  // The newest pack decides game policy for this run; it is not written back.
  if (const auto latest = cedu::homework::find_latest_pack(ctx.base); latest.has_value()) {
    cedu::homework::apply_pack_policy(ctx.settings, latest->pack);
  }

  std::cerr << "[cedu] v" << cedu::core::kBuildVersion << " data path: " << ctx.base.string()
            << "\n";

  const int start = config.command_index + 1;
  const std::string& command = config.command;
  if (command == "submit") {
    return cmd_submit(argc, argv, start, ctx);
  }
  if (command == "verify") {
    return cmd_verify(argc, argv, start, ctx);
  }
  if (command == "summaries") {
    return cmd_summaries(argc, argv, start, ctx);
  }
  if (command == "pack-template") {
    return cmd_pack_template(argc, argv, start, ctx);
  }
  if (command == "pack-create") {
    return cmd_pack_create(argc, argv, start, ctx);
  }
  if (command == "pack-latest") {
    return cmd_pack_latest(argc, argv, start, ctx);
  }
  if (command == "modules") {
    return cmd_modules(argc, argv, start, ctx);
  }
  if (command == "ask") {
    return cmd_ask(argc, argv, start, ctx);
  }
  if (command == "settings") {
    return cmd_settings(argc, argv, start, ctx);
  }

  std::cerr << "Unhandled command: " << command << "\n";
  return 1;
}
