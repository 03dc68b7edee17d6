#pragma once

#include "cedu/assist/model_cache.h"
#include "cedu/config/settings.h"

#include <ostream>
#include <string>

// execute_ask: generate an answer through cache and print the filtered reply.
int execute_ask(const std::string& question, const cedu::config::Settings& settings,
                cedu::assist::ModelCache& cache, std::ostream& out);
