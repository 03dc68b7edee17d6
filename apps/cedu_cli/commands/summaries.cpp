#include "summaries.h"

#include "cedu/homework/submission_store.h"

#include "shared/arg_parser.h"
#include "summaries_logic.h"
#include <iostream>
#include <vector>

namespace {

struct SummariesCliConfig {};

}  // namespace

int cmd_summaries(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                  const AppContext& ctx) {
  const std::vector<cedu::apps::Option<SummariesCliConfig>> options;
  auto parsed = cedu::apps::parse_options(argc, argv, options, start);
  if (!parsed.ok) {
    return 1;
  }

  cedu::homework::FileSubmissionStore store(cedu::homework::completed_dir_for(ctx.base));
  return execute_summaries(store, std::cout);
}
