#pragma once

#include "app_context.h"

// cmd_verify: check the hash chain of one submission file (--file) or of every
// stored submission. Exits 1 if anything fails to load or verify.
int cmd_verify(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
               const AppContext& ctx);
