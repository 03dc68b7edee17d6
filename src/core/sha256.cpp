#include "cedu/core/sha256.h"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace cedu::core {

namespace {

// FIPS 180-4 §5.3.3 initial hash values.
constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
constexpr std::array<std::uint32_t, 64> kRound = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr(std::uint32_t x, unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept {
  return rotr(x, 2u) ^ rotr(x, 13u) ^ rotr(x, 22u);
}

constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept {
  return rotr(x, 6u) ^ rotr(x, 11u) ^ rotr(x, 25u);
}

constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept {
  return rotr(x, 7u) ^ rotr(x, 18u) ^ (x >> 3u);
}

constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept {
  return rotr(x, 17u) ^ rotr(x, 19u) ^ (x >> 10u);
}

}  // namespace

Sha256::Sha256() : state_(kInitialState) {}

void Sha256::update(std::string_view bytes) {
  const auto* data = reinterpret_cast<const std::uint8_t*>(bytes.data());  // NOLINT
  std::size_t remaining = bytes.size();
  total_bytes_ += remaining;

  // Top up a partially filled block first.
  if (buffered_ > 0) {
    const std::size_t take = std::min(remaining, buffer_.size() - buffered_);
    std::memcpy(buffer_.data() + buffered_, data, take);
    buffered_ += take;
    data += take;
    remaining -= take;
    if (buffered_ < buffer_.size()) {
      return;
    }
    process_block(buffer_.data());
    buffered_ = 0;
  }

  while (remaining >= 64u) {
    process_block(data);
    data += 64u;
    remaining -= 64u;
  }

  if (remaining > 0) {
    std::memcpy(buffer_.data(), data, remaining);
    buffered_ = remaining;
  }
}

std::string Sha256::hex_digest() {
  // §5.1.1 padding: a single 1 bit, zeroes, then the 64-bit big-endian message length.
  const std::uint64_t bit_len = total_bytes_ * 8u;

  buffer_[buffered_++] = 0x80u;
  if (buffered_ > 56u) {
    std::memset(buffer_.data() + buffered_, 0, buffer_.size() - buffered_);
    process_block(buffer_.data());
    buffered_ = 0;
  }
  std::memset(buffer_.data() + buffered_, 0, 56u - buffered_);
  for (unsigned i = 0; i < 8u; ++i) {
    buffer_[56u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }
  process_block(buffer_.data());
  buffered_ = 0;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (const std::uint32_t word : state_) {
    oss << std::setw(8) << word;
  }
  return oss.str();
}

void Sha256::process_block(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = (static_cast<std::uint32_t>(block[i * 4u]) << 24u) |
           (static_cast<std::uint32_t>(block[i * 4u + 1u]) << 16u) |
           (static_cast<std::uint32_t>(block[i * 4u + 2u]) << 8u) |
           static_cast<std::uint32_t>(block[i * 4u + 3u]);
  }
  for (unsigned i = 16u; i < 64u; ++i) {
    w[i] = small_sigma1(w[i - 2u]) + w[i - 7u] + small_sigma0(w[i - 15u]) + w[i - 16u];
  }

  std::array<std::uint32_t, 8> v = state_;
  for (unsigned i = 0; i < 64u; ++i) {
    const std::uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const std::uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t t1 = v[7] + big_sigma1(v[4]) + ch + kRound[i] + w[i];
    const std::uint32_t t2 = big_sigma0(v[0]) + maj;
    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + t1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = t1 + t2;
  }

  for (unsigned i = 0; i < 8u; ++i) {
    state_[i] += v[i];
  }
}

std::string sha256_hex(std::string_view input) {
  Sha256 hasher;
  hasher.update(input);
  return hasher.hex_digest();
}

}  // namespace cedu::core
