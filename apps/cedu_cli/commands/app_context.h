#pragma once

#include "cedu/config/settings.h"

#include <filesystem>

// State every subcommand receives from main: the resolved data directory and
// the settings loaded from it, with the latest homework pack policy applied.
struct AppContext {
  std::filesystem::path base;  // NOLINT(readability-identifier-naming)
  cedu::config::Settings settings;  // NOLINT(readability-identifier-naming)
};
