#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cedu::homework {

// Automatic score/feedback estimate attached to a submission.
// Both fields are optional in stored documents.
struct Premark {
  std::optional<int> score;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> feedback;  // NOLINT(readability-identifier-naming)

  bool operator==(const Premark&) const = default;
};

// Length heuristic over the trimmed answer text (byte length):
//   score:    >400 -> 90, >200 -> 80, >100 -> 70, >40 -> 60, else 50
//   feedback: <50 "add detail", <150 "good start", else "looks thorough"
[[nodiscard]] Premark simple_premark(std::string_view answer_text);

}  // namespace cedu::homework
