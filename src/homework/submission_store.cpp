#include "cedu/homework/submission_store.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace cedu::homework {

namespace fs = std::filesystem;

namespace {

using SaveResult = core::Result<SaveOutcome, StoreError>;
using LoadResult = core::Result<SubmissionRecord, StoreError>;

// Keys become part of a file name; anything that could leave the directory is refused.
bool is_safe_key(std::string_view key) {
  if (key.empty() || key == "." || key == "..") {
    return false;
  }
  return std::none_of(key.begin(), key.end(),
                      [](char c) { return c == '/' || c == '\\' || c == '\0'; });
}

StoreError io_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
  return StoreError{StoreErrorKind::kIo, what + " " + path.string() + ": " + ec.message()};
}

}  // namespace

std::string submission_file_name(std::string_view assignment_id, std::string_view student_id) {
  std::string name = "submission_";
  name.append(assignment_id);
  name.push_back('_');
  name.append(student_id);
  name.append(".json");
  return name;
}

fs::path completed_dir_for(const fs::path& base) {
  return base / "homework" / "completed";
}

FileSubmissionStore::FileSubmissionStore(fs::path directory, OverwritePolicy policy)
    : directory_(std::move(directory)), policy_(policy) {}

fs::path FileSubmissionStore::path_for(std::string_view assignment_id,
                                       std::string_view student_id) const {
  return directory_ / submission_file_name(assignment_id, student_id);
}

SaveResult FileSubmissionStore::save(const SubmissionRecord& record) {
  if (!is_safe_key(record.assignment_id) || !is_safe_key(record.student_id)) {
    return SaveResult::err(StoreError{
        StoreErrorKind::kInvalidKey,
        "assignment_id and student_id must be non-empty and contain no path separators"});
  }

  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    return SaveResult::err(io_error("cannot create directory", directory_, ec));
  }

  const fs::path target = path_for(record.assignment_id, record.student_id);
  const bool exists = fs::exists(target, ec);
  if (ec) {
    return SaveResult::err(io_error("cannot stat", target, ec));
  }
  if (exists && policy_ == OverwritePolicy::kReject) {
    return SaveResult::err(StoreError{StoreErrorKind::kAlreadyExists,
                                      "submission already exists: " + target.string()});
  }

  std::string document;
  try {
    document = submission_to_json(record).dump(2);
  } catch (const nlohmann::json::exception& e) {
    return SaveResult::err(StoreError{StoreErrorKind::kEncoding, e.what()});
  }

  fs::path temp = target;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return SaveResult::err(StoreError{StoreErrorKind::kIo, "cannot open " + temp.string()});
    }
    out << document;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(temp, ec);
      return SaveResult::err(StoreError{StoreErrorKind::kIo, "write failed: " + temp.string()});
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    const StoreError err = io_error("cannot replace", target, ec);
    std::error_code cleanup_ec;
    fs::remove(temp, cleanup_ec);
    return SaveResult::err(err);
  }

  if (exists) {
    std::cerr << "[store] WARNING: replaced earlier submission " << target.filename().string()
              << " (previous attempt is gone)\n";
  }
  return SaveResult::ok(SaveOutcome{target, exists});
}

LoadResult FileSubmissionStore::load(const fs::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return LoadResult::err(StoreError{StoreErrorKind::kIo, "cannot read " + path.string()});
  }
  std::ostringstream contents;
  contents << in.rdbuf();

  try {
    return LoadResult::ok(submission_from_json(nlohmann::json::parse(contents.str())));
  } catch (const nlohmann::json::exception& e) {
    return LoadResult::err(StoreError{StoreErrorKind::kParse, e.what()});
  } catch (const std::invalid_argument& e) {
    return LoadResult::err(StoreError{StoreErrorKind::kParse, e.what()});
  }
}

std::vector<SubmissionRecord> FileSubmissionStore::load_all() const {
  std::vector<SubmissionRecord> records;

  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    return records;  // nothing submitted yet
  }

  std::vector<fs::path> files;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    std::cerr << "[store] WARNING: could not list " << directory_.string() << ": "
              << ec.message() << "\n";
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    auto loaded = load(file);
    if (!loaded.has_value()) {
      std::cerr << "[store] WARNING: skipping " << file.filename().string() << ": "
                << loaded.error().message << "\n";
      continue;
    }
    records.push_back(std::move(loaded.value()));
  }
  return records;
}

}  // namespace cedu::homework
