#include "seqrun/queue.h"
#include "seqrun/proc.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace seqrun {

static constexpr int kStopPollMs = 50;

std::string append_job_log(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    if (!path.parent_path().empty()) std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream f(path, std::ios::binary | std::ios::app);
    if (!f) return "cannot open " + path.string();
    f << text;
    f.flush();
    if (!f) return "write failed: " + path.string();
    return "";
}

JobQueue::JobQueue(QueueConfig cfg)
    : cfg_(std::move(cfg)), store_(cfg_.queue_file), audit_(cfg_.audit_file) {
    store_.set_fsync(cfg_.fsync);
    audit_.set_fsync(cfg_.fsync);
}

void JobQueue::audit(const std::string& message) {
    std::string err = audit_.append(message);
    if (!err.empty()) {
        std::cerr << "[seqrun] audit log " << audit_.path().string() << ": " << err << "\n";
    }
}

JobId JobQueue::add_job(const std::string& command, const std::string& name) {
    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("command must not be empty");
    }

    Job job;
    job.name = name.empty() ? derive_job_name(command) : name;
    job.command = command;
    job.status = JobStatus::PENDING;

    store_.update([&](QueueState& qs) {
        // the counter only moves forward, so removed ids are never handed out again
        do {
            job.id = std::to_string(qs.next_id++);
        } while (qs.find(job.id));
        job.created_at = now_ms();
        qs.jobs.push_back(job);
        return true;
    });

    audit("Added job " + job.id + ": " + job.name);
    return job.id;
}

std::optional<Job> JobQueue::get_job(const JobId& id) const {
    QueueState qs = store_.load();
    if (const Job* j = qs.find(id)) return *j;
    return std::nullopt;
}

std::vector<Job> JobQueue::get_status() const {
    return store_.load().jobs;
}

bool JobQueue::remove_job(const JobId& id, std::string* reason) {
    std::string why;
    bool removed = store_.update([&](QueueState& qs) {
        auto it = std::find_if(qs.jobs.begin(), qs.jobs.end(),
                               [&](const Job& j) { return j.id == id; });
        if (it == qs.jobs.end()) {
            why = "job not found";
            return false;
        }
        if (it->status != JobStatus::PENDING) {
            why = std::string("job is ") + status_to_str(it->status) + ", only pending jobs can be removed";
            return false;
        }
        qs.jobs.erase(it);
        return true;
    });

    if (!removed) {
        if (reason) *reason = why;
        return false;
    }
    audit("Removed job " + id);
    return true;
}

bool JobQueue::stop_job(const JobId& id, std::string* reason) {
    std::string why;
    bool requested = store_.update([&](QueueState& qs) {
        Job* j = qs.find(id);
        if (!j) {
            why = "job not found";
            return false;
        }
        if (j->status != JobStatus::RUNNING) {
            why = std::string("job is ") + status_to_str(j->status) + ", only running jobs can be stopped";
            return false;
        }
        j->stop_requested = true;
        return true;
    });
    if (!requested) {
        if (reason) *reason = why;
        return false;
    }

    // Settles the outcome once the job has left `running`.
    auto settled = [&](const std::optional<Job>& j) -> std::optional<bool> {
        if (!j) {
            why = "job disappeared while stopping";
            return false;
        }
        if (j->status == JobStatus::RUNNING) return std::nullopt;
        if (j->status == JobStatus::STOPPED) return true;
        why = std::string("job ") + status_to_str(j->status) + " before it could be stopped";
        return false;
    };

    // The worker owns the child and services the request between wait slices.
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(cfg_.stop_grace_ms + cfg_.stop_wait_margin_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto done = settled(get_job(id))) {
            if (!*done && reason) *reason = why;
            return *done;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kStopPollMs));
    }

    // Nobody answered: no live worker owns this job. Stop the recorded
    // process group from here.
    auto job = get_job(id);
    if (auto done = settled(job)) {
        if (!*done && reason) *reason = why;
        return *done;
    }
    // a group that is gone, or whose id now belongs to older processes, has
    // nothing of this job left in it
    const bool owns_group = job->pid && group_started_since(*job->pid, job->started_at.value_or(0));
    if (owns_group && !kill_process_group(*job->pid, cfg_.stop_grace_ms)) {
        if (reason) *reason = "cannot signal process group " + std::to_string(*job->pid);
        return false;
    }
    if (!finish_job(id, JobStatus::STOPPED, kStoppedExitCode)) {
        auto done = settled(get_job(id)).value_or(false);
        if (!done && reason) *reason = why;
        return done;
    }

    std::string err = append_job_log(cfg_.job_log_path(id), "\nJob was stopped by user\n");
    if (!err.empty()) std::cerr << "[seqrun] job log: " << err << "\n";
    audit("Stopped job " + id + (job->pid ? " (PID: " + std::to_string(*job->pid) + ")" : std::string()));
    return true;
}

size_t JobQueue::clear_finished() {
    size_t dropped = 0;
    store_.update([&](QueueState& qs) {
        auto keep_end = std::stable_partition(qs.jobs.begin(), qs.jobs.end(),
                                              [](const Job& j) { return !is_terminal(j.status); });
        dropped = (size_t)std::distance(keep_end, qs.jobs.end());
        qs.jobs.erase(keep_end, qs.jobs.end());
        return dropped > 0;
    });
    if (dropped > 0) audit("Cleared " + std::to_string(dropped) + " finished jobs");
    return dropped;
}

std::vector<std::string> JobQueue::tail_log(size_t n) const {
    return audit_.tail(n);
}

std::optional<Job> JobQueue::claim_next() {
    std::optional<Job> claimed;
    store_.update([&](QueueState& qs) {
        for (auto& j : qs.jobs) {
            if (j.status != JobStatus::PENDING) continue;
            j.status = JobStatus::RUNNING;
            j.started_at = std::max(now_ms(), j.created_at.value_or(0));
            j.stop_requested = false;
            j.pid.reset();
            claimed = j;
            return true;
        }
        return false;
    });
    return claimed;
}

bool JobQueue::attach_pid(const JobId& id, int pid) {
    return store_.update([&](QueueState& qs) {
        Job* j = qs.find(id);
        if (!j || j->status != JobStatus::RUNNING) return false;
        j->pid = pid;
        return true;
    });
}

bool JobQueue::finish_job(const JobId& id, JobStatus status, int exit_code) {
    return store_.update([&](QueueState& qs) {
        Job* j = qs.find(id);
        if (!j || !can_transition(j->status, status)) return false;
        j->status = status;
        j->completed_at = std::max(now_ms(), j->started_at.value_or(0));
        j->exit_code = exit_code;
        j->pid.reset();
        return true;
    });
}

bool JobQueue::stop_requested(const JobId& id) const {
    QueueState qs = store_.load();
    const Job* j = qs.find(id);
    return j && j->status == JobStatus::RUNNING && j->stop_requested;
}

std::vector<JobId> JobQueue::recover_orphans() {
    struct Orphan {
        JobId id;
        std::optional<int> pid;
        int64_t started_at;
    };
    std::vector<Orphan> orphans;
    store_.update([&](QueueState& qs) {
        for (auto& j : qs.jobs) {
            if (j.status != JobStatus::RUNNING) continue;
            orphans.push_back({j.id, j.pid, j.started_at.value_or(0)});
            j.status = JobStatus::FAILED;
            j.completed_at = std::max(now_ms(), j.started_at.value_or(0));
            j.exit_code = kOrphanedExitCode;
            j.pid.reset();
        }
        return !orphans.empty();
    });

    std::vector<JobId> ids;
    for (const auto& o : orphans) {
        const JobId& id = o.id;
        // the previous worker is gone; anything still in the group is stray,
        // unless the group id has since been reused by unrelated processes
        if (o.pid && group_started_since(*o.pid, o.started_at)) (void)kill_process_group(*o.pid, 0);
        std::string err = append_job_log(cfg_.job_log_path(id),
                                         "\nWorker exited while this job was running; marked failed\n");
        if (!err.empty()) std::cerr << "[seqrun] job log: " << err << "\n";
        audit("Recovered orphaned job " + id);
        ids.push_back(id);
    }
    return ids;
}

} // namespace seqrun
