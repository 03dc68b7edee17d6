#pragma once

#include "cedu/config/settings.h"

#include <string>
#include <string_view>

namespace cedu::assist {

// Lowercases, maps leetspeak digits and symbols to letters, and drops every
// other non-letter ("f*u-c_k" -> "fuck", "sh1t" -> "shit").
[[nodiscard]] std::string normalize_for_filter(std::string_view text);

[[nodiscard]] std::string drop_vowels(std::string_view text);

// Only user_input is screened. Returns answer unchanged when the filter is
// disabled or nothing matched, otherwise janet.fallback_message.
[[nodiscard]] std::string apply_safety_filter(const config::JanetConfig& janet,
                                              const std::string& answer,
                                              const std::string& user_input);

}  // namespace cedu::assist
