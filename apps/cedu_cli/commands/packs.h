#pragma once

#include "app_context.h"

// cmd_pack_template: write a sample pack to homework/assigned/.
// cmd_pack_create:   write a one-assignment pack built from flags.
// cmd_pack_latest:   show the pack that currently sets policy.
int cmd_pack_template(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                      const AppContext& ctx);
int cmd_pack_create(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                    const AppContext& ctx);
int cmd_pack_latest(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                    const AppContext& ctx);
