#pragma once

#include "app_context.h"

// cmd_ask: answer a question with the local model, screened by the safety filter.
int cmd_ask(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
            const AppContext& ctx);
