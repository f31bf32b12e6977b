#pragma once

#include "audit_log.h"
#include "config.h"
#include "store.h"
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace seqrun {

// JobQueue: every operation on the queue, for CLI callers and the worker.
//
// Each mutating call is exactly one JobStore::update() critical section, so
// it is safe from any number of processes at once. Preconditions that fail
// (unknown id, wrong status) return false; the optional `reason` receives a
// human-readable explanation. StoreCorruption propagates.
class JobQueue {
public:
    explicit JobQueue(QueueConfig cfg);

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // --- caller operations ---

    // Throws std::invalid_argument for an empty command.
    JobId add_job(const std::string& command, const std::string& name = "");

    std::optional<Job> get_job(const JobId& id) const;

    // Insertion order, oldest first.
    std::vector<Job> get_status() const;

    // Only pending jobs can be removed.
    bool remove_job(const JobId& id, std::string* reason = nullptr);

    // Only running jobs can be stopped. Asks the worker through the store and
    // waits for it; if no worker answers within stop_grace_ms plus a margin,
    // kills the recorded process group directly. On success the job is
    // `stopped` with kStoppedExitCode and its processes are gone.
    bool stop_job(const JobId& id, std::string* reason = nullptr);

    // Drops completed/failed/stopped jobs, keeps the rest in order.
    // Returns the number dropped.
    size_t clear_finished();

    std::vector<std::string> tail_log(size_t n) const;

    // --- worker operations ---

    // Oldest pending job -> running, started_at = now. nullopt if none.
    std::optional<Job> claim_next();

    // Records the child's process group on a running job.
    bool attach_pid(const JobId& id, int pid);

    // running -> terminal. False (and no change) if the job is no longer
    // running, e.g. a stop already finalized it.
    bool finish_job(const JobId& id, JobStatus status, int exit_code);

    bool stop_requested(const JobId& id) const;

    // Jobs left `running` by a worker that is gone are failed with
    // kOrphanedExitCode. Caller must hold the worker lock. Returns their ids.
    std::vector<JobId> recover_orphans();

    // Writes an event to the audit log; failures go to stderr.
    void audit(const std::string& message);

    const QueueConfig& config() const { return cfg_; }
    const JobStore& store() const { return store_; }

private:
    QueueConfig cfg_;
    JobStore store_;
    AuditLog audit_;
};

// Appends a line to a job's output log; returns empty string on success.
std::string append_job_log(const std::filesystem::path& path, const std::string& text);

} // namespace seqrun
