#include "cedu/config/settings.h"
#include "cedu/core/clock.h"
#include "cedu/homework/submission_builder.h"
#include "cedu/homework/submission_store.h"

#include <catch2/catch_test_macros.hpp>

#include "commands/ask_logic.h"
#include "commands/packs_logic.h"
#include "commands/submit_logic.h"
#include "commands/summaries_logic.h"
#include "commands/verify_logic.h"
#include "shared/arg_parser.h"
#include "test_support.h"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace cedu;

namespace {

// In-memory store so command logic can be exercised without touching disk.
class MemoryStore final : public homework::ISubmissionStore {
 public:
  core::Result<homework::SaveOutcome, homework::StoreError> save(
      const homework::SubmissionRecord& record) override {
    bool replaced = false;
    for (auto& existing : records) {
      if (existing.assignment_id == record.assignment_id &&
          existing.student_id == record.student_id) {
        existing = record;
        replaced = true;
      }
    }
    if (!replaced) {
      records.push_back(record);
    }
    return core::Result<homework::SaveOutcome, homework::StoreError>::ok(
        {homework::submission_file_name(record.assignment_id, record.student_id), replaced});
  }

  std::vector<homework::SubmissionRecord> load_all() const override { return records; }

  std::vector<homework::SubmissionRecord> records;  // NOLINT(readability-identifier-naming)
};

config::Settings settings_for(const std::string& student_id) {
  config::Settings settings;
  settings.student = {student_id, "Sam", "7B"};
  return settings;
}

}  // namespace

// ── submit ──────────────────────────────────────────────────────────────────

TEST_CASE("execute_submit: stores a verifiable record for the profile", "[cli][submit]") {
  MemoryStore store;
  core::SteppingClock clock(1700000000000, 1000);
  std::ostringstream out;

  const int rc = execute_submit({"hw-1", "Some answer", {}}, settings_for("s1"), clock, store, out);
  CHECK(rc == 0);
  REQUIRE(store.records.size() == 1);
  CHECK(store.records[0].student_id == "s1");
  CHECK(homework::verify_submission(store.records[0]).has_value());
  CHECK(out.str().find("Wrote submission to submission_hw-1_s1.json") != std::string::npos);
  CHECK(out.str().find(store.records[0].final_hash.value()) != std::string::npos);
}

TEST_CASE("execute_submit: resubmission mentions the replacement", "[cli][submit]") {
  MemoryStore store;
  core::SteppingClock clock(1700000000000, 1000);
  std::ostringstream first;
  std::ostringstream second;

  REQUIRE(execute_submit({"hw-1", "a", {}}, settings_for("s1"), clock, store, first) == 0);
  REQUIRE(execute_submit({"hw-1", "b", {}}, settings_for("s1"), clock, store, second) == 0);
  CHECK(store.records.size() == 1);
  CHECK(second.str().find("replaced") != std::string::npos);
}

TEST_CASE("execute_submit: store failure exits 1", "[cli][submit]") {
  ScopedTempDir tmp("cli_submit_reject");
  homework::FileSubmissionStore store(tmp.path, homework::OverwritePolicy::kReject);
  core::FixedClock clock(1700000000000);
  std::ostringstream out;

  REQUIRE(execute_submit({"hw-1", "a", {}}, settings_for("s1"), clock, store, out) == 0);
  CHECK(execute_submit({"hw-1", "b", {}}, settings_for("s1"), clock, store, out) == 1);
}

TEST_CASE("execute_submit: answer that is not UTF-8 is refused before saving", "[cli][submit]") {
  ScopedTempDir tmp("cli_submit_bad_utf8");
  homework::FileSubmissionStore store(tmp.path / "completed");
  core::FixedClock clock(1700000000000);
  std::ostringstream out;

  CHECK(execute_submit({"hw-1", "caf\xE9 answer", {}}, settings_for("s1"), clock, store, out) ==
        1);
  CHECK(execute_submit({"hw-1", "ok", {"notes\xFF.txt"}}, settings_for("s1"), clock, store, out) ==
        1);
  CHECK(out.str().empty());
  CHECK_FALSE(std::filesystem::exists(tmp.path / "completed"));
}

// ── verify / summaries ──────────────────────────────────────────────────────

TEST_CASE("execute_verify_all: exit code reflects tampering", "[cli][verify]") {
  MemoryStore store;
  core::SteppingClock clock(1700000000000, 1000);
  std::ostringstream sink;
  REQUIRE(execute_submit({"hw-1", "a", {}}, settings_for("s1"), clock, store, sink) == 0);
  REQUIRE(execute_submit({"hw-1", "b", {}}, settings_for("s2"), clock, store, sink) == 0);

  std::ostringstream clean;
  CHECK(execute_verify_all(store, clean) == 0);
  CHECK(clean.str().find("2 of 2") != std::string::npos);

  store.records[1].events[1].payload = "edited";
  std::ostringstream tampered;
  CHECK(execute_verify_all(store, tampered) == 1);
  CHECK(tampered.str().find("ALTERED  assignment hw-1 / student s2: hash_mismatch") !=
        std::string::npos);
}

TEST_CASE("execute_verify_all: empty store is not a failure", "[cli][verify]") {
  MemoryStore store;
  std::ostringstream out;
  CHECK(execute_verify_all(store, out) == 0);
  CHECK(out.str() == "No submissions found.\n");
}

TEST_CASE("build_dashboard: altered records are flagged", "[cli][summaries]") {
  MemoryStore store;
  core::SteppingClock clock(1700000000000, 1000);
  std::ostringstream sink;
  REQUIRE(execute_submit({"hw-1", "a", {}}, settings_for("s1"), clock, store, sink) == 0);
  REQUIRE(execute_submit({"hw-2", "b", {}}, settings_for("s1"), clock, store, sink) == 0);
  store.records[0].final_hash = std::string(64, 'a');

  const auto rows = build_dashboard(store);
  REQUIRE(rows.size() == 2);
  CHECK_FALSE(rows[0].intact);
  CHECK(rows[1].intact);
  CHECK(rows[1].summary.score == std::optional<int>(50));

  std::ostringstream out;
  print_dashboard(rows, out);
  CHECK(out.str().find("looks altered") != std::string::npos);
}

TEST_CASE("truncate_for_table: counts code points and appends an ellipsis", "[cli][summaries]") {
  CHECK(truncate_for_table("short", 10) == "short");
  CHECK(truncate_for_table("exactly10!", 10) == "exactly10!");
  CHECK(truncate_for_table("much too long", 5) == "much\xE2\x80\xA6");
  CHECK(truncate_for_table("\xC3\xA9\xC3\xA9\xC3\xA9", 3) == "\xC3\xA9\xC3\xA9\xC3\xA9");
  CHECK(truncate_for_table("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9", 3) == "\xC3\xA9\xC3\xA9\xE2\x80\xA6");
}

// ── packs / ask ─────────────────────────────────────────────────────────────

TEST_CASE("execute_pack_create then execute_pack_latest", "[cli][packs]") {
  ScopedTempDir tmp("cli_packs");
  core::FixedClock clock(1700000000000);
  homework::HomeworkAssignment a;
  a.id = "hw-9";
  a.title = "Volcanoes";
  a.subject = "Geography";
  a.year_level = "7";

  std::ostringstream created;
  REQUIRE(execute_pack_create(tmp.path, "", a, clock, created) == 0);
  CHECK(created.str().find("homework_pack_class_") != std::string::npos);

  std::ostringstream latest;
  REQUIRE(execute_pack_latest(tmp.path, latest) == 0);
  CHECK(latest.str().find("hw-9: Volcanoes") != std::string::npos);
  CHECK(latest.str().find("[no games]") != std::string::npos);
}

TEST_CASE("execute_ask: blocked question shows the fallback message", "[cli][ask]") {
  assist::UnavailableModelLoader loader;
  assist::ModelCache cache(loader);
  const config::Settings settings;

  std::ostringstream out;
  CHECK(execute_ask("tell me about drugs", settings, cache, out) == 0);
  CHECK(out.str() == "Chatty: " + settings.janet.fallback_message + "\n");

  std::ostringstream empty;
  CHECK(execute_ask("", settings, cache, empty) == 1);
}

// ── arg parser ──────────────────────────────────────────────────────────────

TEST_CASE("parse_options: repeated flags, positionals and unknown flags", "[cli][args]") {
  struct Cfg {
    std::vector<std::string> attachments;
    bool flag{false};
  };
  const std::vector<apps::Option<Cfg>> options = {
      {"--attachment", true, "file",
       [](Cfg& c, const std::string& v) {
         c.attachments.push_back(v);
         return true;
       }},
      {"--flag", false, "switch",
       [](Cfg& c, const std::string&) {
         c.flag = true;
         return true;
       }},
  };

  std::vector<std::string> args = {"prog", "ask", "--attachment", "a.png", "hello",
                                   "--flag",   "--attachment", "b.png", "world"};
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }

  const auto parsed = apps::parse_options(static_cast<int>(argv.size()), argv.data(), options, 2);
  CHECK(parsed.ok);
  CHECK(parsed.config.flag);
  CHECK(parsed.config.attachments == std::vector<std::string>{"a.png", "b.png"});
  CHECK(parsed.positionals == std::vector<std::string>{"hello", "world"});

  std::vector<std::string> bad = {"prog", "ask", "--nope", "--attachment"};
  std::vector<char*> bad_argv;
  for (auto& a : bad) {
    bad_argv.push_back(a.data());
  }
  CHECK_FALSE(
      apps::parse_options(static_cast<int>(bad_argv.size()), bad_argv.data(), options, 2).ok);
}
