#pragma once

#include "app_context.h"

// cmd_summaries: print the completed-homework dashboard.
int cmd_summaries(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                  const AppContext& ctx);
