#pragma once
#include "proc.h"

#include <filesystem>
#include <string>

namespace seqrun {

enum class Profile { DEV, PROD };

// Detect profile from SEQRUN_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: no fsync, short stop grace
// PROD: fsync queue file and audit log, longer stop grace
void apply_profile_defaults(Profile p);

int getenv_int(const char* k, int defv);

// Everything a queue or worker needs to know about where state lives and
// how jobs are executed.
struct QueueConfig {
    std::filesystem::path home;
    std::filesystem::path queue_file;   // <home>/job_queue.json
    std::filesystem::path audit_file;   // <home>/job_queue.log
    std::filesystem::path logs_dir;     // <home>/job_logs
    std::filesystem::path worker_lock;  // <home>/worker.lock

    int poll_ms{1000};          // idle sleep between polls
    int stop_grace_ms{5000};    // SIGTERM -> SIGKILL delay
    int stop_wait_margin_ms{3000};  // extra time a stop request waits for the worker
    bool fsync{false};
    ShellSpec shell;

    // Standard layout under one directory, built-in defaults.
    static QueueConfig for_home(const std::filesystem::path& home);

    std::filesystem::path job_log_path(const std::string& job_id) const;
};

// Standard layout under SEQRUN_HOME (default: current directory) with
// SEQRUN_POLL_MS, SEQRUN_STOP_GRACE_MS, SEQRUN_FSYNC and SEQRUN_SHELL applied.
QueueConfig load_config();

} // namespace seqrun
