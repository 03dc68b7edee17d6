#pragma once

#include "config.h"
#include <string>

namespace cedu::cli {

// validate_cli_config checks the global flags before any file is touched.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - the global flags parsed cleanly
// - a subcommand is present and known
// - --base-path, when given, is non-empty and not an existing regular file
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace cedu::cli
