#pragma once

#include "cedu/homework/submission_record.h"
#include "cedu/homework/submission_store.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct DashboardRow {
  cedu::homework::SubmissionSummary summary;  // NOLINT(readability-identifier-naming)
  bool intact{false};                         // NOLINT(readability-identifier-naming)
};

// Summaries of every stored record plus its verification status.
[[nodiscard]] std::vector<DashboardRow> build_dashboard(
    const cedu::homework::ISubmissionStore& store);

// Cuts text to max_chars code points, ending in an ellipsis when shortened.
[[nodiscard]] std::string truncate_for_table(std::string_view text, std::size_t max_chars);

void print_dashboard(const std::vector<DashboardRow>& rows, std::ostream& out);

int execute_summaries(const cedu::homework::ISubmissionStore& store, std::ostream& out);
