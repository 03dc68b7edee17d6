#pragma once

#include "app_context.h"

// cmd_settings: print the effective settings (after pack policy) as JSON.
int cmd_settings(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                 const AppContext& ctx);
