#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cedu::core {

// Incremental SHA-256 (FIPS 180-4).
//
// Feed any number of byte ranges with update(), then call hex_digest() once.
// Feeding "ab" then "c" yields the same digest as feeding "abc".
class Sha256 {
 public:
  Sha256();

  void update(std::string_view bytes);

  // Finishes the computation and returns the 64-character lower-case hex digest.
  // The object must not be updated again afterwards.
  [[nodiscard]] std::string hex_digest();

 private:
  void process_block(const std::uint8_t* block);

  std::array<std::uint32_t, 8> state_;
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

// One-shot convenience: lower-case hex SHA-256 of input.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace cedu::core
