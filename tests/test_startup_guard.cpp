#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "startup_guard.h"

#include "test_support.h"

#include <optional>
#include <string>

using namespace cedu::cli;

// ── Command presence ────────────────────────────────────────────────────────

TEST_CASE("validate_cli_config: missing command returns error", "[startup][config]") {
  CliConfig config;
  CHECK_FALSE(validate_cli_config(config).empty());
}

TEST_CASE("validate_cli_config: unknown command returns error", "[startup][config]") {
  CliConfig config;
  config.command = "launch";
  const auto error = validate_cli_config(config);
  REQUIRE_FALSE(error.empty());
  CHECK(error.find("launch") != std::string::npos);
}

TEST_CASE("validate_cli_config: known command without base path is valid", "[startup][config]") {
  CliConfig config;
  config.command = "verify";
  CHECK(validate_cli_config(config).empty());
}

// ── Base path ───────────────────────────────────────────────────────────────

TEST_CASE("validate_cli_config: empty base path returns error", "[startup][config]") {
  CliConfig config;
  config.command = "summaries";
  config.base_path = "";
  CHECK_FALSE(validate_cli_config(config).empty());
}

TEST_CASE("validate_cli_config: base path that is a file returns error", "[startup][config]") {
  ScopedTempDir tmp("guard_file_base");
  write_text_file(tmp.path / "data", "not a directory");

  CliConfig config;
  config.command = "summaries";
  config.base_path = (tmp.path / "data").string();
  CHECK_FALSE(validate_cli_config(config).empty());
}

TEST_CASE("validate_cli_config: base path that does not exist yet is valid",
          "[startup][config]") {
  ScopedTempDir tmp("guard_new_base");
  CliConfig config;
  config.command = "submit";
  config.base_path = (tmp.path / "fresh").string();
  CHECK(validate_cli_config(config).empty());
}

TEST_CASE("validate_cli_config: global parse failure returns error", "[startup][config]") {
  CliConfig config;
  config.command = "verify";
  config.parse_ok = false;
  CHECK_FALSE(validate_cli_config(config).empty());
}

// ── parse_global_args ───────────────────────────────────────────────────────

TEST_CASE("parse_global_args: flags before the command", "[startup][config]") {
  std::string prog = "cedu_cli";
  std::string flag = "--base-path";
  std::string dir = "/tmp/cedu";
  std::string cmd = "verify";
  std::string sub_flag = "--file";
  char* argv[] = {prog.data(), flag.data(), dir.data(), cmd.data(), sub_flag.data()};

  const auto config = parse_global_args(5, argv);
  CHECK(config.parse_ok);
  CHECK(config.base_path == std::optional<std::string>("/tmp/cedu"));
  CHECK(config.command == "verify");
  CHECK(config.command_index == 3);
}

TEST_CASE("parse_global_args: --base-path without a value fails", "[startup][config]") {
  std::string prog = "cedu_cli";
  std::string flag = "--base-path";
  char* argv[] = {prog.data(), flag.data()};

  const auto config = parse_global_args(2, argv);
  CHECK_FALSE(config.parse_ok);
  CHECK(config.command.empty());
}
