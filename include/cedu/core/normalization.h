#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cedu::core {

// ASCII-only, locale-independent text helpers. Non-ASCII bytes pass through unchanged.

inline char ascii_lower(const char ch) {
  constexpr char kCaseOffset = 'a' - 'A';
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + kCaseOffset) : ch;
}

inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(ascii_lower(ch));
  }
  return result;
}

inline bool iequals_ascii(const std::string_view a, const std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(a[i]) != ascii_lower(b[i])) {
      return false;
    }
  }
  return true;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// Strict UTF-8 check: rejects overlong forms, surrogates and code points past U+10FFFF.
// Text that fails here cannot be written as JSON without loss.
inline bool is_valid_utf8(const std::string_view input) {
  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) {
        min_second = 0xA0;
      } else if (lead == 0xED) {
        max_second = 0x9F;
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) {
        min_second = 0x90;
      } else if (lead == 0xF4) {
        max_second = 0x8F;
      }
    } else {
      return false;
    }

    if (input.size() - i < length) {
      return false;
    }
    const auto second = static_cast<unsigned char>(input[i + 1]);
    if (second < min_second || second > max_second) {
      return false;
    }
    for (std::size_t k = 2; k < length; ++k) {
      const auto cont = static_cast<unsigned char>(input[i + k]);
      if (cont < 0x80 || cont > 0xBF) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

}  // namespace cedu::core
