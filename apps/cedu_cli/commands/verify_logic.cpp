#include "verify_logic.h"

#include "cedu/integrity/chain_verifier.h"

#include <cstddef>

std::string describe_failure(const cedu::homework::SubmissionRecord& record,
                             const cedu::integrity::IntegrityError& error) {
  std::string line = "assignment " + record.assignment_id + " / student " + record.student_id +
                     ": " + cedu::integrity::to_string(error.kind);
  if (!error.message.empty()) {
    line += " (" + error.message + ")";
  }
  return line;
}

int report_verification(const std::vector<cedu::homework::SubmissionRecord>& records,
                        std::ostream& out) {
  std::size_t failures = 0;
  for (const auto& record : records) {
    const auto result = cedu::homework::verify_submission(record);
    if (result.has_value()) {
      out << "OK       assignment " << record.assignment_id << " / student " << record.student_id
          << " (" << result.value() << " events)\n";
    } else {
      ++failures;
      out << "ALTERED  " << describe_failure(record, result.error()) << "\n";
    }
  }
  out << records.size() - failures << " of " << records.size() << " submission(s) verified\n";
  return failures == 0 ? 0 : 1;
}

int execute_verify_all(const cedu::homework::ISubmissionStore& store, std::ostream& out) {
  const auto records = store.load_all();
  if (records.empty()) {
    out << "No submissions found.\n";
    return 0;
  }
  return report_verification(records, out);
}
