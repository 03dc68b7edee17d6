#pragma once

#include "app_context.h"

// cmd_submit: build, premark and store a submission for --assignment with --answer text.
int cmd_submit(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
               const AppContext& ctx);
