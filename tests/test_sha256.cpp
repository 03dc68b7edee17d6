#include "cedu/core/sha256.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using cedu::core::Sha256;
using cedu::core::sha256_hex;

TEST_CASE("sha256_hex: empty input matches the FIPS 180-4 vector", "[sha256]") {
  CHECK(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sha256_hex: abc matches the FIPS 180-4 vector", "[sha256]") {
  CHECK(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256_hex: two-block message matches the FIPS 180-4 vector", "[sha256]") {
  CHECK(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Sha256: split updates equal a single update", "[sha256]") {
  const std::string message(1000, 'x');

  Sha256 incremental;
  incremental.update(message.substr(0, 3));
  incremental.update(message.substr(3, 61));
  incremental.update(message.substr(64, 500));
  incremental.update(message.substr(564));

  CHECK(incremental.hex_digest() == sha256_hex(message));
}

TEST_CASE("sha256_hex: output is 64 lowercase hex characters", "[sha256]") {
  const auto digest = sha256_hex("Chatty-EDU");
  REQUIRE(digest.size() == 64);
  for (const char c : digest) {
    CHECK(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
  }
}
