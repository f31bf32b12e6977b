#pragma once

#include "file_lock.h"
#include "queue.h"

#include <atomic>
#include <string>

namespace seqrun {

// Worker: executes queued jobs one at a time, oldest first.
//
// Only one worker may run per queue home; run() takes worker.lock and fails
// if another worker holds it. A single job's failure never ends the loop;
// StoreCorruption does.
class Worker {
public:
    explicit Worker(JobQueue& queue);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Takes the worker lock and recovers orphaned jobs. Returns empty string
    // on success, else why the worker cannot start.
    std::string start();

    // Polls until keep_running turns false. Calls start() if needed.
    // Returns 0 on a clean shutdown, 1 if start() failed.
    int run(const std::atomic<bool>& keep_running);

    // Claims and runs the oldest pending job to completion. Returns false if
    // nothing was pending. keep_running turning false mid-job stops the job.
    bool run_next_job(const std::atomic<bool>& keep_running);

    size_t jobs_run() const { return jobs_run_; }

private:
    // Runs one claimed job; returns the final status written.
    JobStatus execute(const Job& job, const std::atomic<bool>& keep_running);
    // Writes the terminal status and the job log footer. False if the job
    // had already left `running`.
    bool finalize(const Job& job, JobStatus status, int exit_code, const std::string& note);

    JobQueue& queue_;
    FileLock lock_;
    size_t jobs_run_{0};
};

} // namespace seqrun
