// seqrun_pidwait: wait for an unrelated process to exit, then run a command.
//
// Shares no state with the job queue. Everything it does is recorded in its
// own log file under <SEQRUN_HOME>/pidwait_logs/.

#include "seqrun/audit_log.h"
#include "seqrun/config.h"
#include "seqrun/proc.h"
#include "seqrun/types.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

using namespace seqrun;

static std::atomic<bool> g_interrupted{false};

static std::string stamp_for_filename() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: seqrun_pidwait <pid_to_wait_for> <command_to_run_after_pid_exits...>\n"
                  << "  SIGINT/SIGTERM while waiting: exit 130 without running the command\n"
                  << "  SIGINT/SIGTERM while the command runs: stop its process group\n";
        return 2;
    }

    pid_t target = 0;
    try {
        size_t pos = 0;
        long v = std::stol(argv[1], &pos);
        if (pos != std::string(argv[1]).size() || v <= 0) throw std::invalid_argument("pid");
        target = (pid_t)v;
    } catch (const std::exception&) {
        std::cerr << "seqrun_pidwait: invalid pid: " << argv[1] << "\n";
        return 2;
    }

    std::string command;
    for (int i = 2; i < argc; i++) {
        if (i > 2) command.push_back(' ');
        command += argv[i];
    }

    // SIGINT/SIGTERM abandon the wait, or stop the command once it runs
    std::signal(SIGTERM, [](int) { g_interrupted.store(true); });
    std::signal(SIGINT,  [](int) { g_interrupted.store(true); });

    const QueueConfig cfg = load_config();
    const int heartbeat_s = std::max(1, getenv_int("SEQRUN_PIDWAIT_HEARTBEAT_S", 60));
    const auto log_path = cfg.home / "pidwait_logs" /
                          ("pidwait_" + stamp_for_filename() + "_" + std::to_string(::getpid()) + ".log");

    AuditLog log(log_path);
    std::string err = log.open();
    if (!err.empty()) {
        std::cerr << "seqrun_pidwait: " << log_path.string() << ": " << err << "\n";
        return 3;
    }
    auto note = [&](const std::string& msg) {
        std::string e = log.append(msg);
        if (!e.empty()) std::cerr << "[pidwait] log: " << e << "\n";
        std::cerr << "[pidwait] " << msg << "\n";
    };

    note("started watcher pid=" + std::to_string(::getpid()) + ", waiting for PID " +
         std::to_string(target) + ", then: " + command);

    const auto started = std::chrono::steady_clock::now();
    auto next_beat = started + std::chrono::seconds(heartbeat_s);
    while (pid_alive(target)) {
        if (g_interrupted.load()) {
            note("interrupted while waiting for PID " + std::to_string(target) + ", command not run");
            return 130;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= next_beat) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - started).count();
            note("heartbeat: PID " + std::to_string(target) + " still running (" +
                 std::to_string(elapsed) + "s)");
            next_beat = now + std::chrono::seconds(heartbeat_s);
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    note("PID " + std::to_string(target) + " has exited, running: " + command);

    ChildProcess child;
    err = child.spawn(cfg.shell, command, log_path);
    if (!err.empty()) {
        note("failed to start command: " + err);
        return 127;
    }
    // the command has its own process group, so terminal signals reach only
    // us; pass an interrupt on to the whole group
    int code = 0;
    while (!child.try_wait(&code)) {
        if (g_interrupted.load()) {
            code = child.terminate(cfg.stop_grace_ms);
            note("interrupted, stopped command (pid " + std::to_string(child.pid()) +
                 "): exit code " + std::to_string(code));
            return code;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    note("completed: exit code " + std::to_string(code));
    return code;
}
