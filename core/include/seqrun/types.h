#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seqrun {

// Opaque job identifier, allocated from the store's persisted counter.
using JobId = std::string;

// Job lifecycle states. Transitions only move forward (see can_transition).
enum class JobStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    STOPPED,
};

// Exit code sentinels for jobs that did not produce a real exit status.
constexpr int kStoppedExitCode = -15;     // stopped on request
constexpr int kSpawnFailedExitCode = -1;  // child could not be started
constexpr int kOrphanedExitCode = -2;     // found running with no live worker

struct Job {
    JobId id;
    std::string name;
    std::string command;
    JobStatus status{JobStatus::PENDING};

    // epoch ms; unset until the corresponding transition happens
    std::optional<int64_t> created_at;
    std::optional<int64_t> started_at;
    std::optional<int64_t> completed_at;
    std::optional<int> exit_code;

    // Process group of the live child (bookkeeping for the stop path).
    std::optional<int> pid;
    bool stop_requested{false};
};

// Everything persisted in the queue file.
struct QueueState {
    int64_t next_id{1};
    std::vector<Job> jobs;

    Job* find(const JobId& id);
    const Job* find(const JobId& id) const;
};

const char* status_to_str(JobStatus st);
std::optional<JobStatus> status_from_str(const std::string& s);

bool is_terminal(JobStatus st);
bool can_transition(JobStatus from, JobStatus to);

// Largest cut <= max_bytes that does not split a UTF-8 sequence.
size_t utf8_prefix_len(const std::string& s, size_t max_bytes);

// Default label when the caller gives no name: the command, whitespace
// collapsed, cut to 40 characters.
std::string derive_job_name(const std::string& command);

int64_t now_ms();

// "2026-10-17 14:03:11" in local time.
std::string format_local_time(int64_t epoch_ms);

} // namespace seqrun
