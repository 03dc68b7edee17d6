#include "modules.h"

#include "modules_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ModulesCliConfig {
  std::optional<std::string> role;
};

}  // namespace

int cmd_modules(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                const AppContext& ctx) {
  const std::vector<cedu::apps::Option<ModulesCliConfig>> options = {
      {"--role", true, "Only list modules visible to this role (teacher|student)",
       [](ModulesCliConfig& c, const std::string& v) {
         c.role = v;
         return true;
       }},
  };
  auto parsed = cedu::apps::parse_options(argc, argv, options, start);
  if (!parsed.ok) {
    return 1;
  }
  return execute_modules(ctx.base, parsed.config.role, std::cout);
}
