#pragma once

#include "cedu/config/settings.h"
#include "cedu/core/clock.h"
#include "cedu/homework/homework_pack.h"

#include <filesystem>
#include <ostream>
#include <string>

int execute_pack_template(const std::filesystem::path& base, const cedu::config::Settings& settings,
                          cedu::core::IClock& clock, std::ostream& out);

// class_id falls back to the student profile's class, then "class".
int execute_pack_create(const std::filesystem::path& base, const std::string& class_id,
                        const cedu::homework::HomeworkAssignment& assignment,
                        cedu::core::IClock& clock, std::ostream& out);

int execute_pack_latest(const std::filesystem::path& base, std::ostream& out);
