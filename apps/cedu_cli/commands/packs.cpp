#include "packs.h"

#include "cedu/core/clock.h"
#include "cedu/homework/homework_pack.h"

#include "packs_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct NoFlags {};

struct PackCreateCliConfig {
  std::optional<std::string> assignment_id;
  std::optional<std::string> title;
  std::optional<std::string> class_id;
  std::optional<std::string> subject;
  std::optional<std::string> due_at;
  std::optional<std::string> instructions;
  bool allow_games{false};
  bool allow_ai_premark{true};
};

}  // namespace

int cmd_pack_template(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                      const AppContext& ctx) {
  const std::vector<cedu::apps::Option<NoFlags>> options;
  if (!cedu::apps::parse_options(argc, argv, options, start).ok) {
    return 1;
  }
  cedu::core::SystemClock clock;
  return execute_pack_template(ctx.base, ctx.settings, clock, std::cout);
}

int cmd_pack_create(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                    const AppContext& ctx) {
  const std::vector<cedu::apps::Option<PackCreateCliConfig>> options = {
      {"--assignment", true, "Assignment id",
       [](PackCreateCliConfig& c, const std::string& v) {
         c.assignment_id = v;
         return true;
       }},
      {"--title", true, "Assignment title (defaults to the id)",
       [](PackCreateCliConfig& c, const std::string& v) {
         c.title = v;
         return true;
       }},
      {"--class", true, "Class id (defaults to the student profile's class)",
       [](PackCreateCliConfig& c, const std::string& v) {
         c.class_id = v;
         return true;
       }},
      {"--subject", true, "Subject name",
       [](PackCreateCliConfig& c, const std::string& v) {
         c.subject = v;
         return true;
       }},
      {"--due", true, "Due date (RFC 3339)",
       [](PackCreateCliConfig& c, const std::string& v) {
         c.due_at = v;
         return true;
       }},
      {"--instructions", true, "Markdown instructions",
       [](PackCreateCliConfig& c, const std::string& v) {
         c.instructions = v;
         return true;
       }},
      {"--allow-games", false, "Keep games available while this pack is active",
       [](PackCreateCliConfig& c, const std::string&) {
         c.allow_games = true;
         return true;
       }},
      {"--no-premark", false, "Disable the automatic premark for this assignment",
       [](PackCreateCliConfig& c, const std::string&) {
         c.allow_ai_premark = false;
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

  cedu::homework::HomeworkAssignment assignment;
  assignment.id = config.assignment_id.value();
  assignment.title = config.title.value_or(assignment.id);
  assignment.subject = config.subject.value_or("General");
  assignment.year_level = ctx.settings.default_year_level;
  assignment.due_at = config.due_at;
  assignment.instructions_md = config.instructions.value_or("");
  assignment.allow_games = config.allow_games;
  assignment.allow_ai_premark = config.allow_ai_premark;

  cedu::core::SystemClock clock;
  return execute_pack_create(ctx.base, config.class_id.value_or(ctx.settings.student.class_id),
                             assignment, clock, std::cout);
}

int cmd_pack_latest(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
                    const AppContext& ctx) {
  const std::vector<cedu::apps::Option<NoFlags>> options;
  if (!cedu::apps::parse_options(argc, argv, options, start).ok) {
    return 1;
  }
  return execute_pack_latest(ctx.base, std::cout);
}
