#include "seqrun/types.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace seqrun {

Job* QueueState::find(const JobId& id) {
    for (auto& j : jobs) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

const Job* QueueState::find(const JobId& id) const {
    for (const auto& j : jobs) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

const char* status_to_str(JobStatus st) {
    switch (st) {
        case JobStatus::PENDING:   return "pending";
        case JobStatus::RUNNING:   return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED:    return "failed";
        case JobStatus::STOPPED:   return "stopped";
    }
    return "pending";
}

std::optional<JobStatus> status_from_str(const std::string& s) {
    if (s == "pending") return JobStatus::PENDING;
    if (s == "running") return JobStatus::RUNNING;
    if (s == "completed") return JobStatus::COMPLETED;
    if (s == "failed") return JobStatus::FAILED;
    if (s == "stopped") return JobStatus::STOPPED;
    return std::nullopt;
}

bool is_terminal(JobStatus st) {
    return st == JobStatus::COMPLETED || st == JobStatus::FAILED || st == JobStatus::STOPPED;
}

bool can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::PENDING:
            return to == JobStatus::RUNNING;
        case JobStatus::RUNNING:
            return is_terminal(to);
        default:
            return false;
    }
}

size_t utf8_prefix_len(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s.size();
    size_t n = max_bytes;
    // s[n] is the first byte dropped; back up while it is a continuation byte
    while (n > 0 && ((unsigned char)s[n] & 0xC0) == 0x80) n--;
    return n;
}

std::string derive_job_name(const std::string& command) {
    constexpr size_t kMaxName = 40;
    std::string out;
    bool in_space = false;
    for (char c : command) {
        if (std::isspace((unsigned char)c)) {
            in_space = !out.empty();
            continue;
        }
        if (in_space) {
            out.push_back(' ');
            in_space = false;
        }
        out.push_back(c);
    }
    if (out.size() > kMaxName) {
        out.resize(utf8_prefix_len(out, kMaxName - 3));
        out += "...";
    }
    return out;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_local_time(int64_t epoch_ms) {
    std::time_t t = (std::time_t)(epoch_ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace seqrun
