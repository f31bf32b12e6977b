#include "seqrun/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace seqrun {

Profile detect_profile() {
    const char* env = std::getenv("SEQRUN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before any threads are started: setenv() races getenv().
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("SEQRUN_FSYNC",         "0",    NO_OVERWRITE);
            setenv("SEQRUN_STOP_GRACE_MS", "2000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("SEQRUN_FSYNC",         "1",    NO_OVERWRITE);
            setenv("SEQRUN_STOP_GRACE_MS", "5000", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoi(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

QueueConfig QueueConfig::for_home(const std::filesystem::path& home) {
    QueueConfig c;
    c.home = home;
    c.queue_file = home / "job_queue.json";
    c.audit_file = home / "job_queue.log";
    c.logs_dir = home / "job_logs";
    c.worker_lock = home / "worker.lock";
    return c;
}

std::filesystem::path QueueConfig::job_log_path(const std::string& job_id) const {
    return logs_dir / ("job_" + job_id + ".log");
}

QueueConfig load_config() {
    std::filesystem::path home = std::filesystem::current_path();
    if (const char* e = std::getenv("SEQRUN_HOME")) {
        if (*e) home = std::filesystem::path(e);
    }
    if (!home.is_absolute()) home = std::filesystem::absolute(home);

    QueueConfig c = QueueConfig::for_home(home);
    c.poll_ms = std::clamp(getenv_int("SEQRUN_POLL_MS", c.poll_ms), 10, 60000);
    c.stop_grace_ms = std::clamp(getenv_int("SEQRUN_STOP_GRACE_MS", c.stop_grace_ms), 0, 600000);
    c.fsync = (getenv_int("SEQRUN_FSYNC", 0) != 0);
    if (const char* sh = std::getenv("SEQRUN_SHELL")) {
        if (*sh) c.shell.path = sh;
    }
    return c;
}

} // namespace seqrun
