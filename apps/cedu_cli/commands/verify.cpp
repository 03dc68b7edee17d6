#include "verify.h"

#include "cedu/homework/submission_store.h"

#include "shared/arg_parser.h"
#include "verify_logic.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct VerifyCliConfig {
  std::optional<std::string> file;
};

}  // namespace

int cmd_verify(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
               const AppContext& ctx) {
  const std::vector<cedu::apps::Option<VerifyCliConfig>> options = {
      {"--file", true, "Verify a single submission file instead of the whole store",
       [](VerifyCliConfig& c, const std::string& v) {
         c.file = v;
         return true;
       }},
  };
  auto parsed = cedu::apps::parse_options(argc, argv, options, start);
  if (!parsed.ok) {
    return 1;
  }

  cedu::homework::FileSubmissionStore store(cedu::homework::completed_dir_for(ctx.base));

  if (!parsed.config.file.has_value()) {
    return execute_verify_all(store, std::cout);
  }

  auto loaded = store.load(parsed.config.file.value());
  if (!loaded.has_value()) {
    std::cerr << "Could not load " << parsed.config.file.value() << ": "
              << loaded.error().message << "\n";
    return 1;
  }
  return report_verification({loaded.value()}, std::cout);
}
