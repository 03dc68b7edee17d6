#include "cedu/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace cedu::core;

TEST_CASE("is_valid_utf8: accepts ASCII and well-formed multibyte text", "[normalization]") {
  CHECK(is_valid_utf8(""));
  CHECK(is_valid_utf8("plain ascii"));
  CHECK(is_valid_utf8("caf\xC3\xA9"));              // U+00E9
  CHECK(is_valid_utf8("\xE2\x82\xAC"));             // U+20AC
  CHECK(is_valid_utf8("\xF0\x9F\x93\x9A books"));   // U+1F4DA
  CHECK(is_valid_utf8("\xF4\x8F\xBF\xBF"));         // U+10FFFF
}

TEST_CASE("is_valid_utf8: rejects malformed sequences", "[normalization]") {
  CHECK_FALSE(is_valid_utf8("caf\xE9"));            // Latin-1 byte
  CHECK_FALSE(is_valid_utf8("caf\xFF"));
  CHECK_FALSE(is_valid_utf8("\xC3"));               // truncated
  CHECK_FALSE(is_valid_utf8("\xE2\x82"));
  CHECK_FALSE(is_valid_utf8("\xC0\xAF"));           // overlong '/'
  CHECK_FALSE(is_valid_utf8("\xE0\x80\xAF"));
  CHECK_FALSE(is_valid_utf8("\xED\xA0\x80"));       // surrogate half
  CHECK_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));   // past U+10FFFF
  CHECK_FALSE(is_valid_utf8("\x80 stray"));         // lone continuation
}

TEST_CASE("trim and iequals_ascii", "[normalization]") {
  CHECK(trim("  hello \n") == "hello");
  CHECK(trim("   ").empty());
  CHECK(iequals_ascii("Teacher", "tEACHER"));
  CHECK_FALSE(iequals_ascii("teacher", "teachers"));
}
