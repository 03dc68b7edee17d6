#include "ask_logic.h"

#include "cedu/assist/safety_filter.h"

#include <iostream>

int execute_ask(const std::string& question, const cedu::config::Settings& settings,
                cedu::assist::ModelCache& cache, std::ostream& out) {
  if (question.empty()) {
    std::cerr << "Error: nothing to ask\n";
    return 1;
  }
  const auto raw = cedu::assist::generate_answer(cache, settings.model, question);
  out << "Chatty: " << cedu::assist::apply_safety_filter(settings.janet, raw, question) << "\n";
  return 0;
}
