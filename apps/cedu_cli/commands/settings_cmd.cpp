#include "settings_cmd.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <vector>

namespace {

struct SettingsCliConfig {};

}  // namespace

int cmd_settings(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                 const AppContext& ctx) {
  const std::vector<cedu::apps::Option<SettingsCliConfig>> options;
  if (!cedu::apps::parse_options(argc, argv, options, start).ok) {
    return 1;
  }
  std::cout << cedu::config::settings_to_json(ctx.settings).dump(2) << "\n";
  return 0;
}
