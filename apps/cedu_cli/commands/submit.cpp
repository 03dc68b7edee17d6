#include "submit.h"

#include "cedu/core/clock.h"
#include "cedu/homework/submission_store.h"

#include "shared/arg_parser.h"
#include "submit_logic.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct SubmitCliConfig {
  std::optional<std::string> assignment_id;
  std::optional<std::string> answer;
  std::vector<std::string> attachments;
  bool no_overwrite{false};
};

}  // namespace

int cmd_submit(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
               const AppContext& ctx) {
  const std::vector<cedu::apps::Option<SubmitCliConfig>> options = {
      {"--assignment", true, "Assignment id the answer belongs to",
       [](SubmitCliConfig& c, const std::string& v) {
         c.assignment_id = v;
         return true;
       }},
      {"--answer", true, "Free-form answer text",
       [](SubmitCliConfig& c, const std::string& v) {
         c.answer = v;
         return true;
       }},
      {"--attachment", true, "Path of an attached file (repeatable)",
       [](SubmitCliConfig& c, const std::string& v) {
         if (v.empty()) {
           std::cerr << "Ignoring empty --attachment\n";
           return false;
         }
         c.attachments.push_back(v);
         return true;
       }},
      {"--no-overwrite", false, "Fail instead of replacing an existing submission",
       [](SubmitCliConfig& c, const std::string&) {
         c.no_overwrite = true;
         return true;
       }},
  };
  auto parsed = cedu::apps::parse_options(argc, argv, options, start);
  if (!parsed.ok) {
    return 1;
  }
  const auto& config = parsed.config;

  if (!config.assignment_id.has_value() || config.assignment_id->empty()) {
    std::cerr << "Error: --assignment <id> is required\n";
    return 1;
  }
  if (!config.answer.has_value()) {
    std::cerr << "Error: --answer <text> is required\n";
    return 1;
  }

  const auto policy = config.no_overwrite ? cedu::homework::OverwritePolicy::kReject
                                          : cedu::homework::OverwritePolicy::kReplace;
  cedu::homework::FileSubmissionStore store(cedu::homework::completed_dir_for(ctx.base), policy);
  cedu::core::SystemClock clock;

  const SubmitRequest request{config.assignment_id.value(), config.answer.value(),
                              config.attachments};
  return execute_submit(request, ctx.settings, clock, store, std::cout);
}
