#pragma once

#include "seqrun/types.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace seqrun {

// ---- CLI helpers shared by the cmd_* entry points ----

// Process exit codes of the seqrun CLI.
constexpr int kExitOk = 0;
constexpr int kExitRefused = 1;   // not found / wrong state
constexpr int kExitUsage = 2;
constexpr int kExitFatal = 3;     // store corruption, I/O failure

// "-" for unset timestamps.
std::string format_opt_time(const std::optional<int64_t>& epoch_ms);

void print_job_table(std::ostream& out, const std::vector<Job>& jobs);
void print_job_detail(std::ostream& out, const Job& job);

// JSON rendering of one job or a list (json-c, pretty).
std::string job_json_text(const Job& job);
std::string jobs_json_text(const std::vector<Job>& jobs);

// Strict integer parse for flag values.
std::optional<int> parse_int_arg(const std::string& s);

std::string slurp_file(const std::string& path);

} // namespace seqrun
