#include "ask.h"

#include "cedu/assist/model_cache.h"

#include "ask_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct AskCliConfig {};

}  // namespace

int cmd_ask(int argc, char* argv[], int start,  // NOLINT(modernize-avoid-c-arrays)
            const AppContext& ctx) {
  const std::vector<cedu::apps::Option<AskCliConfig>> options;
  auto parsed = cedu::apps::parse_options(argc, argv, options, start);
  if (!parsed.ok) {
    return 1;
  }

  std::string question;
  for (const auto& word : parsed.positionals) {
    if (!question.empty()) {
      question += ' ';
    }
    question += word;
  }

  cedu::assist::UnavailableModelLoader loader;
  cedu::assist::ModelCache cache(loader);
  return execute_ask(question, ctx.settings, cache, std::cout);
}
