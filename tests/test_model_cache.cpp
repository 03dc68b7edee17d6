#include "cedu/assist/model_cache.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

using namespace cedu;
using assist::ModelCache;

namespace {

class FakeModel final : public assist::ILanguageModel {
 public:
  explicit FakeModel(std::string reply) : reply_(std::move(reply)) {}

  core::Result<std::string, std::string> complete(const std::string& prompt,
                                                  std::uint32_t max_tokens) override {
    last_prompt = prompt;
    last_max_tokens = max_tokens;
    if (fail) {
      return core::Result<std::string, std::string>::err("session failed");
    }
    return core::Result<std::string, std::string>::ok(reply_);
  }

  std::string last_prompt;        // NOLINT(readability-identifier-naming)
  std::uint32_t last_max_tokens{0};  // NOLINT(readability-identifier-naming)
  bool fail{false};               // NOLINT(readability-identifier-naming)

 private:
  std::string reply_;
};

class FakeLoader final : public assist::IModelLoader {
 public:
  core::Result<assist::ModelHandle, std::string> load(const std::filesystem::path& path) override {
    ++loads;
    if (path.empty() || path == "missing.gguf") {
      return core::Result<assist::ModelHandle, std::string>::err("Model file not found: " +
                                                                 path.string());
    }
    model = std::make_shared<FakeModel>(reply);
    return core::Result<assist::ModelHandle, std::string>::ok(model);
  }

  int loads{0};                       // NOLINT(readability-identifier-naming)
  std::string reply{"  Plants use sunlight.  \n"};  // NOLINT(readability-identifier-naming)
  std::shared_ptr<FakeModel> model;   // NOLINT(readability-identifier-naming)
};

config::ModelConfig model_at(const std::string& path, std::uint32_t max_tokens = 256) {
  config::ModelConfig cfg;
  cfg.path = path;
  cfg.max_tokens = max_tokens;
  return cfg;
}

}  // namespace

TEST_CASE("ModelCache: same path loads once", "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);

  const auto first = cache.get_or_load("a.gguf");
  const auto second = cache.get_or_load("a.gguf");
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value() == second.value());
  CHECK(loader.loads == 1);
  CHECK(cache.cached_path() == "a.gguf");
}

TEST_CASE("ModelCache: a different path replaces the cached model", "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);

  REQUIRE(cache.get_or_load("a.gguf").has_value());
  REQUIRE(cache.get_or_load("b.gguf").has_value());
  CHECK(loader.loads == 2);
  CHECK(cache.cached_path() == "b.gguf");
}

TEST_CASE("ModelCache: invalidate and reload hit the loader again", "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);

  REQUIRE(cache.get_or_load("a.gguf").has_value());
  cache.invalidate();
  CHECK_FALSE(cache.has_model());
  REQUIRE(cache.get_or_load("a.gguf").has_value());
  REQUIRE(cache.reload("a.gguf").has_value());
  CHECK(loader.loads == 3);
}

TEST_CASE("ModelCache: failed load leaves nothing cached", "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);

  const auto result = cache.get_or_load("missing.gguf");
  REQUIRE_FALSE(result.has_value());
  CHECK_FALSE(cache.has_model());
}

TEST_CASE("generate_answer: prompt wraps the question and output is trimmed",
          "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);

  const auto answer = assist::generate_answer(cache, model_at("a.gguf"), "How do plants grow?");
  CHECK(answer == "Plants use sunlight.");
  REQUIRE(loader.model != nullptr);
  CHECK(loader.model->last_prompt ==
        "You are Chatty-EDU, an offline school AI helper. Answer plainly, safely, and briefly."
        "\n\nUser: How do plants grow?\nAssistant:");
  CHECK(loader.model->last_max_tokens == 256);
}

TEST_CASE("generate_answer: token budget never drops below the minimum",
          "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);
  (void)assist::generate_answer(cache, model_at("a.gguf", 4), "hi");
  REQUIRE(loader.model != nullptr);
  CHECK(loader.model->last_max_tokens == 16);
}

TEST_CASE("generate_answer: failures become a friendly sentence", "[assist][model_cache]") {
  FakeLoader loader;
  ModelCache cache(loader);

  CHECK(assist::generate_answer(cache, model_at("missing.gguf"), "hi") ==
        "I couldn't run the local model yet (Model file not found: missing.gguf).");

  loader.reply = "   ";
  CHECK(assist::generate_answer(cache, model_at("a.gguf"), "hi") ==
        "I couldn't run the local model yet (Model returned an empty response).");

  loader.model->fail = true;
  CHECK(assist::generate_answer(cache, model_at("a.gguf"), "hi") ==
        "I couldn't run the local model yet (session failed).");
}

TEST_CASE("UnavailableModelLoader: reports a missing file first", "[assist][model_cache]") {
  assist::UnavailableModelLoader loader;
  const auto result = loader.load("/definitely/not/here.gguf");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == "Model file not found: /definitely/not/here.gguf");
}
