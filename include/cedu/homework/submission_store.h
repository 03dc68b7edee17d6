#pragma once

#include "cedu/core/result.h"
#include "cedu/homework/submission_record.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cedu::homework {

// What save() does when a file for the same assignment/student already exists.
// kReplace: last export wins; the replacement is logged and reported in SaveOutcome.
// kReject:  the existing file is left alone and save() returns kAlreadyExists.
enum class OverwritePolicy {
  kReplace,  // NOLINT(readability-identifier-naming)
  kReject,   // NOLINT(readability-identifier-naming)
};

enum class StoreErrorKind {
  kIo,             // NOLINT(readability-identifier-naming)
  kParse,          // NOLINT(readability-identifier-naming)
  kAlreadyExists,  // NOLINT(readability-identifier-naming)
  kInvalidKey,     // NOLINT(readability-identifier-naming)
  kEncoding,       // record text cannot be written as JSON (not valid UTF-8)
};

struct StoreError {
  StoreErrorKind kind{StoreErrorKind::kIo};  // NOLINT(readability-identifier-naming)
  std::string message;                       // NOLINT(readability-identifier-naming)
};

struct SaveOutcome {
  std::filesystem::path path;      // NOLINT(readability-identifier-naming)
  bool replaced_existing{false};   // NOLINT(readability-identifier-naming)
};

// ISubmissionStore persists one document per (assignment_id, student_id).
class ISubmissionStore {
 public:
  virtual ~ISubmissionStore() = default;

  [[nodiscard]] virtual core::Result<SaveOutcome, StoreError> save(
      const SubmissionRecord& record) = 0;

  // Every readable record. Unreadable or unparsable entries are logged and skipped.
  [[nodiscard]] virtual std::vector<SubmissionRecord> load_all() const = 0;

 protected:
  ISubmissionStore() = default;
  ISubmissionStore(const ISubmissionStore&) = default;
  ISubmissionStore& operator=(const ISubmissionStore&) = default;
  ISubmissionStore(ISubmissionStore&&) = default;
  ISubmissionStore& operator=(ISubmissionStore&&) = default;
};

// "submission_<assignment_id>_<student_id>.json"
[[nodiscard]] std::string submission_file_name(std::string_view assignment_id,
                                               std::string_view student_id);

// <base>/homework/completed
[[nodiscard]] std::filesystem::path completed_dir_for(const std::filesystem::path& base);

// JSON files under one directory. The directory is created on first save.
// Writes go to a sibling temp file which is then renamed over the target, so a
// failed write never leaves a truncated record behind. The record is serialized
// before any file is opened, so an unencodable record touches nothing on disk.
class FileSubmissionStore final : public ISubmissionStore {
 public:
  explicit FileSubmissionStore(std::filesystem::path directory,
                               OverwritePolicy policy = OverwritePolicy::kReplace);

  [[nodiscard]] core::Result<SaveOutcome, StoreError> save(const SubmissionRecord& record) override;
  [[nodiscard]] std::vector<SubmissionRecord> load_all() const override;

  // Read and parse a single file.
  [[nodiscard]] core::Result<SubmissionRecord, StoreError> load(
      const std::filesystem::path& path) const;

  [[nodiscard]] std::filesystem::path path_for(std::string_view assignment_id,
                                               std::string_view student_id) const;

  [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path directory_;
  OverwritePolicy policy_;
};

}  // namespace cedu::homework
