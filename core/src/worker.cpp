#include "seqrun/worker.h"
#include "seqrun/proc.h"
#include "seqrun/serialization.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace seqrun {

static constexpr int kWaitSliceMs = 100;
static const std::string kRule(50, '=');

static void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

static std::string write_job_log_header(const std::filesystem::path& path, const Job& job) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return "cannot open " + path.string();
    f << "Job ID: " << job.id << "\n";
    f << "Name: " << job.name << "\n";
    f << "Command: " << job.command << "\n";
    f << "Created: " << format_local_time(job.created_at.value_or(0)) << "\n";
    f << "Started: " << format_local_time(job.started_at.value_or(0)) << "\n";
    f << kRule << "\n";
    f.flush();
    if (!f) return "write failed: " + path.string();
    return "";
}

Worker::Worker(JobQueue& queue) : queue_(queue) {}

std::string Worker::start() {
    if (lock_.held()) return "";

    const auto& cfg = queue_.config();
    FileLock lk = FileLock::try_acquire(cfg.worker_lock);
    if (!lk.held()) {
        return "another worker is already running (lock held on " + cfg.worker_lock.string() + ")";
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.logs_dir, ec);
    if (ec) return "create_directories " + cfg.logs_dir.string() + ": " + ec.message();

    lock_ = std::move(lk);

    // holding the lock proves no other worker is alive, so anything still
    // marked running has been abandoned
    for (const auto& id : queue_.recover_orphans()) {
        std::cerr << "[worker] job " << id << " was left running by a previous worker, marked failed\n";
    }

    const char* profile = profile_name(detect_profile());
    queue_.audit(std::string("Worker started (profile: ") + profile + ")");
    std::cerr << "[worker] started pid=" << ::getpid() << " profile=" << profile
              << " home=" << cfg.home.string()
              << " poll_ms=" << cfg.poll_ms << "\n";
    return "";
}

int Worker::run(const std::atomic<bool>& keep_running) {
    std::string err = start();
    if (!err.empty()) {
        std::cerr << "[worker] " << err << "\n";
        return 1;
    }

    const int poll_ms = queue_.config().poll_ms;
    while (keep_running.load()) {
        bool ran = false;
        try {
            ran = run_next_job(keep_running);
        } catch (const StoreCorruption&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[worker] error: " << e.what() << "\n";
            queue_.audit(std::string("Worker error: ") + e.what());
        }
        if (ran) continue;

        // idle: sleep poll_ms, but notice a shutdown request promptly
        for (int slept = 0; slept < poll_ms && keep_running.load(); slept += kWaitSliceMs) {
            sleep_ms(std::min(kWaitSliceMs, poll_ms - slept));
        }
    }

    queue_.audit("Worker stopped");
    std::cerr << "[worker] stopped after " << jobs_run_ << " job(s)\n";
    lock_.release();
    return 0;
}

bool Worker::run_next_job(const std::atomic<bool>& keep_running) {
    auto job = queue_.claim_next();
    if (!job) return false;
    jobs_run_++;

    try {
        (void)execute(*job, keep_running);
    } catch (const StoreCorruption&) {
        throw;
    } catch (const std::exception& e) {
        // the child (if any) was killed when its ChildProcess went out of scope
        std::cerr << "[worker] job " << job->id << ": " << e.what() << "\n";
        if (finalize(*job, JobStatus::FAILED, kSpawnFailedExitCode, std::string("Worker error: ") + e.what())) {
            queue_.audit("Job " + job->id + " failed with worker error: " + e.what());
        }
    }
    return true;
}

JobStatus Worker::execute(const Job& job, const std::atomic<bool>& keep_running) {
    const auto& cfg = queue_.config();
    const auto log_path = cfg.job_log_path(job.id);

    queue_.audit("Starting job " + job.id + ": " + job.name);
    std::cerr << "[worker] starting job " << job.id << ": " << job.command << "\n";

    std::string err = write_job_log_header(log_path, job);
    if (!err.empty()) std::cerr << "[worker] job log: " << err << "\n";

    ChildProcess child;
    err = child.spawn(cfg.shell, job.command, log_path, cfg.home);
    if (!err.empty()) {
        if (finalize(job, JobStatus::FAILED, kSpawnFailedExitCode, "Failed to start: " + err)) {
            queue_.audit("Job " + job.id + " failed to start: " + err);
        }
        std::cerr << "[worker] job " << job.id << " failed to start: " << err << "\n";
        return JobStatus::FAILED;
    }
    (void)queue_.attach_pid(job.id, child.pid());

    int code = 0;
    while (!child.try_wait(&code)) {
        if (!keep_running.load()) {
            (void)child.terminate(cfg.stop_grace_ms);
            if (finalize(job, JobStatus::STOPPED, kStoppedExitCode, "Job was stopped because the worker shut down")) {
                queue_.audit("Worker shutting down, stopped job " + job.id);
            }
            return JobStatus::STOPPED;
        }
        if (queue_.stop_requested(job.id)) {
            const pid_t pid = child.pid();
            (void)child.terminate(cfg.stop_grace_ms);
            if (finalize(job, JobStatus::STOPPED, kStoppedExitCode, "Job was stopped by user")) {
                queue_.audit("Stopped job " + job.id + " (PID: " + std::to_string(pid) + ")");
            }
            std::cerr << "[worker] job " << job.id << " stopped\n";
            return JobStatus::STOPPED;
        }
        sleep_ms(kWaitSliceMs);
    }

    const JobStatus status = (code == 0) ? JobStatus::COMPLETED : JobStatus::FAILED;
    if (finalize(job, status, code, "")) {
        if (code == 0) queue_.audit("Job " + job.id + " completed successfully");
        else queue_.audit("Job " + job.id + " failed with exit code " + std::to_string(code));
    }
    std::cerr << "[worker] job " << job.id << " " << status_to_str(status) << " (exit " << code << ")\n";
    return status;
}

bool Worker::finalize(const Job& job, JobStatus status, int exit_code, const std::string& note) {
    const bool ok = queue_.finish_job(job.id, status, exit_code);
    auto current = queue_.get_job(job.id);

    std::ostringstream foot;
    foot << "\n" << kRule << "\n";
    if (!note.empty()) foot << note << "\n";
    if (current) {
        foot << "Status: " << status_to_str(current->status) << "\n";
        foot << "Exit Code: " << (current->exit_code ? std::to_string(*current->exit_code) : "null") << "\n";
        if (current->completed_at) foot << "Completed: " << format_local_time(*current->completed_at) << "\n";
    }
    std::string err = append_job_log(queue_.config().job_log_path(job.id), foot.str());
    if (!err.empty()) std::cerr << "[worker] job log: " << err << "\n";

    if (!ok) {
        std::cerr << "[worker] job " << job.id << " was already finalized as "
                  << (current ? status_to_str(current->status) : "removed") << "\n";
    }
    return ok;
}

} // namespace seqrun
