#include "cedu/homework/premark.h"

#include "cedu/core/normalization.h"

#include <utility>

namespace cedu::homework {

Premark simple_premark(std::string_view answer_text) {
  const std::size_t len = core::trim(answer_text).size();

  int score = 50;
  if (len > 400) {
    score = 90;
  } else if (len > 200) {
    score = 80;
  } else if (len > 100) {
    score = 70;
  } else if (len > 40) {
    score = 60;
  }

  std::string feedback;
  if (len < 50) {
    feedback = "Try adding more detail to your answers.";
  } else if (len < 150) {
    feedback = "Good start\xE2\x80\x94" "check if all parts are addressed.";
  } else {
    feedback = "Looks thorough. Review for accuracy and clarity.";
  }

  return Premark{score, std::move(feedback)};
}

}  // namespace cedu::homework
