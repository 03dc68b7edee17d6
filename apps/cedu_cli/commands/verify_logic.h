#pragma once

#include "cedu/homework/submission_record.h"
#include "cedu/homework/submission_store.h"

#include <ostream>
#include <string>
#include <vector>

// One "OK" or "ALTERED" line per record. Returns 0 when every record verifies.
int report_verification(const std::vector<cedu::homework::SubmissionRecord>& records,
                        std::ostream& out);

// execute_verify_all: verify everything the store can load.
int execute_verify_all(const cedu::homework::ISubmissionStore& store, std::ostream& out);

// "assignment hw-1 / student s1: hash_mismatch (hash mismatch at index 1)"
[[nodiscard]] std::string describe_failure(const cedu::homework::SubmissionRecord& record,
                                           const cedu::integrity::IntegrityError& error);
