#pragma once

#include "app_context.h"

// cmd_modules: list installed modules, optionally only those visible to --role.
int cmd_modules(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                const AppContext& ctx);
