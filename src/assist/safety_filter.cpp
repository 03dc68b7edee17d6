#include "cedu/assist/safety_filter.h"

#include "cedu/core/normalization.h"

#include <algorithm>
#include <array>
#include <iterator>

namespace cedu::assist {

namespace {

constexpr std::array<std::string_view, 13> kBannedSwears = {
    "fuck", "shit", "cunt", "bitch", "bastard", "crap",   "piss",
    "dick", "cock", "tits", "asshole", "ass",   "bollock",
};

constexpr std::array<std::string_view, 8> kMaskedSwears = {
    "fk", "fck", "fuk", "sht", "sh1t", "btch", "b1tch", "biatch",
};

constexpr std::array<std::string_view, 6> kBannedMature = {
    "sex", "porn", "drugs", "suicide", "kill", "terrorist",
};

bool is_ascii_letter(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool contains(const std::string& haystack, const std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

std::string normalize_for_filter(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char raw : text) {
    const char ch = core::ascii_lower(raw);
    switch (ch) {
      case '0':
        out.push_back('o');
        break;
      case '1':
      case '!':
      case '|':
        out.push_back('i');
        break;
      case '3':
        out.push_back('e');
        break;
      case '4':
        out.push_back('a');
        break;
      case '5':
        out.push_back('s');
        break;
      case '7':
        out.push_back('t');
        break;
      case '8':
        out.push_back('b');
        break;
      case '9':
        out.push_back('g');
        break;
      default:
        if (is_ascii_letter(ch)) {
          out.push_back(ch);
        }
        break;
    }
  }
  return out;
}

std::string drop_vowels(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::copy_if(text.begin(), text.end(), std::back_inserter(out), [](const char ch) {
    return ch != 'a' && ch != 'e' && ch != 'i' && ch != 'o' && ch != 'u';
  });
  return out;
}

std::string apply_safety_filter(const config::JanetConfig& janet, const std::string& answer,
                                const std::string& user_input) {
  if (!janet.enabled) {
    return answer;
  }

  const auto lower_in = core::normalize_ascii_lower(user_input);
  const auto normalized_in = normalize_for_filter(lower_in);
  const auto vowelless_in = drop_vowels(normalized_in);

  const bool swear_hit =
      janet.block_swears &&
      std::any_of(kBannedSwears.begin(), kBannedSwears.end(), [&](const std::string_view word) {
        const auto skeleton = drop_vowels(word);
        return contains(lower_in, word) || contains(normalized_in, word) ||
               (!skeleton.empty() && contains(vowelless_in, skeleton));
      });

  // "sh1t" and "b1tch" never survive normalization; they are matched against the raw text too.
  const bool masked_hit =
      janet.block_swears &&
      std::any_of(kMaskedSwears.begin(), kMaskedSwears.end(), [&](const std::string_view word) {
        return contains(normalized_in, word) || contains(lower_in, word);
      });

  const bool mature_hit =
      janet.block_mature_topics &&
      std::any_of(kBannedMature.begin(), kBannedMature.end(),
                  [&](const std::string_view word) { return contains(lower_in, word); });

  if (swear_hit || masked_hit || mature_hit) {
    return janet.fallback_message;
  }
  return answer;
}

}  // namespace cedu::assist
