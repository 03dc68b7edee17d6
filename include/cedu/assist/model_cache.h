#pragma once

#include "cedu/config/settings.h"
#include "cedu/core/result.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace cedu::assist {

// A loaded local language model.
class ILanguageModel {
 public:
  virtual ~ILanguageModel() = default;

  // Returns the raw completion text for prompt, producing at most max_tokens tokens.
  [[nodiscard]] virtual core::Result<std::string, std::string> complete(
      const std::string& prompt, std::uint32_t max_tokens) = 0;

 protected:
  ILanguageModel() = default;
  ILanguageModel(const ILanguageModel&) = default;
  ILanguageModel& operator=(const ILanguageModel&) = default;
  ILanguageModel(ILanguageModel&&) = default;
  ILanguageModel& operator=(ILanguageModel&&) = default;
};

using ModelHandle = std::shared_ptr<ILanguageModel>;

// Turns a model file path into a ready ILanguageModel.
class IModelLoader {
 public:
  virtual ~IModelLoader() = default;

  [[nodiscard]] virtual core::Result<ModelHandle, std::string> load(
      const std::filesystem::path& path) = 0;

 protected:
  IModelLoader() = default;
  IModelLoader(const IModelLoader&) = default;
  IModelLoader& operator=(const IModelLoader&) = default;
  IModelLoader(IModelLoader&&) = default;
  IModelLoader& operator=(IModelLoader&&) = default;
};

// Loader used when the binary carries no inference backend. Reports a missing
// model file first so users see the most actionable message.
class UnavailableModelLoader final : public IModelLoader {
 public:
  [[nodiscard]] core::Result<ModelHandle, std::string> load(
      const std::filesystem::path& path) override;
};

// At most one model is held at a time. Owned by the caller; not thread-safe.
class ModelCache {
 public:
  explicit ModelCache(IModelLoader& loader) : loader_(loader) {}

  // Returns the cached model when path matches the last successful load.
  [[nodiscard]] core::Result<ModelHandle, std::string> get_or_load(
      const std::filesystem::path& path);

  // Drops the cached model, forcing the next get_or_load to hit the loader.
  void invalidate();

  [[nodiscard]] core::Result<ModelHandle, std::string> reload(const std::filesystem::path& path);

  [[nodiscard]] bool has_model() const { return model_ != nullptr; }
  [[nodiscard]] const std::filesystem::path& cached_path() const { return path_; }

 private:
  IModelLoader& loader_;
  std::filesystem::path path_;
  ModelHandle model_;
};

inline constexpr const char* kAssistantSystemPrompt =
    "You are Chatty-EDU, an offline school AI helper. Answer plainly, safely, and briefly.";
inline constexpr std::uint32_t kMinCompletionTokens = 16;

[[nodiscard]] std::string build_prompt(const std::string& user_input);

// Never fails: load or completion errors become a friendly sentence.
[[nodiscard]] std::string generate_answer(ModelCache& cache, const config::ModelConfig& model,
                                          const std::string& user_input);

}  // namespace cedu::assist
