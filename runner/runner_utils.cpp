#include "runner_utils.h"

#include "seqrun/serialization.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace seqrun {

std::string format_opt_time(const std::optional<int64_t>& epoch_ms) {
    if (!epoch_ms) return "-";
    return format_local_time(*epoch_ms);
}

static std::string clip(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(0, utf8_prefix_len(s, width));
    return s.substr(0, utf8_prefix_len(s, width - 3)) + "...";
}

void print_job_table(std::ostream& out, const std::vector<Job>& jobs) {
    if (jobs.empty()) {
        out << "No jobs in queue\n";
        return;
    }
    out << std::left
        << std::setw(8) << "ID" << "  "
        << std::setw(28) << "NAME" << "  "
        << std::setw(10) << "STATUS" << "  "
        << std::setw(19) << "CREATED" << "  "
        << std::setw(19) << "STARTED" << "  "
        << std::setw(19) << "COMPLETED" << "  "
        << "EXIT" << "\n";
    for (const auto& j : jobs) {
        out << std::setw(8) << clip(j.id, 8) << "  "
            << std::setw(28) << clip(j.name, 28) << "  "
            << std::setw(10) << status_to_str(j.status) << "  "
            << std::setw(19) << format_opt_time(j.created_at) << "  "
            << std::setw(19) << format_opt_time(j.started_at) << "  "
            << std::setw(19) << format_opt_time(j.completed_at) << "  "
            << (j.exit_code ? std::to_string(*j.exit_code) : "-") << "\n";
    }
    out << std::right;
}

void print_job_detail(std::ostream& out, const Job& j) {
    out << "Job ID:    " << j.id << "\n";
    out << "Name:      " << j.name << "\n";
    out << "Command:   " << j.command << "\n";
    out << "Status:    " << status_to_str(j.status) << "\n";
    out << "Created:   " << format_opt_time(j.created_at) << "\n";
    out << "Started:   " << format_opt_time(j.started_at) << "\n";
    out << "Completed: " << format_opt_time(j.completed_at) << "\n";
    out << "Exit Code: " << (j.exit_code ? std::to_string(*j.exit_code) : "-") << "\n";
    if (j.pid) out << "PID:       " << *j.pid << "\n";
    if (j.stop_requested && j.status == JobStatus::RUNNING) out << "Stop:      requested\n";
}

static std::string render(json_object* o) {
    std::string out = json_object_to_json_string_ext(
        o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

std::string job_json_text(const Job& job) {
    return render(job_to_json(job));
}

std::string jobs_json_text(const std::vector<Job>& jobs) {
    json_object* arr = json_object_new_array();
    for (const auto& j : jobs) json_object_array_add(arr, job_to_json(j));
    return render(arr);
}

std::optional<int> parse_int_arg(const std::string& s) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string slurp_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

} // namespace seqrun
