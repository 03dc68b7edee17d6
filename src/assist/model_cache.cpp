#include "cedu/assist/model_cache.h"

#include "cedu/core/normalization.h"

#include <algorithm>
#include <system_error>
#include <utility>

namespace cedu::assist {

core::Result<ModelHandle, std::string> UnavailableModelLoader::load(
    const std::filesystem::path& path) {
  using R = core::Result<ModelHandle, std::string>;
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return R::err("Model file not found: " + path.string());
  }
  return R::err("no inference backend is built into this binary");
}

core::Result<ModelHandle, std::string> ModelCache::get_or_load(const std::filesystem::path& path) {
  using R = core::Result<ModelHandle, std::string>;
  if (model_ != nullptr && path_ == path) {
    return R::ok(model_);
  }
  auto loaded = loader_.load(path);
  if (!loaded.has_value()) {
    return loaded;
  }
  if (loaded.value() == nullptr) {
    return R::err("loader returned no model for " + path.string());
  }
  model_ = loaded.value();
  path_ = path;
  return R::ok(model_);
}

void ModelCache::invalidate() {
  model_.reset();
  path_.clear();
}

core::Result<ModelHandle, std::string> ModelCache::reload(const std::filesystem::path& path) {
  invalidate();
  return get_or_load(path);
}

std::string build_prompt(const std::string& user_input) {
  return std::string(kAssistantSystemPrompt) + "\n\nUser: " + user_input + "\nAssistant:";
}

namespace {

std::string unavailable(const std::string& reason) {
  return "I couldn't run the local model yet (" + reason + ").";
}

}  // namespace

std::string generate_answer(ModelCache& cache, const config::ModelConfig& model,
                            const std::string& user_input) {
  auto handle = cache.get_or_load(model.path);
  if (!handle.has_value()) {
    return unavailable(handle.error());
  }

  const auto max_tokens = std::max(model.max_tokens, kMinCompletionTokens);
  auto completion = handle.value()->complete(build_prompt(user_input), max_tokens);
  if (!completion.has_value()) {
    return unavailable(completion.error());
  }

  auto cleaned = core::trim(completion.value());
  if (cleaned.empty()) {
    return unavailable("Model returned an empty response");
  }
  return cleaned;
}

}  // namespace cedu::assist
