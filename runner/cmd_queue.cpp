#include "cmd_queue.h"
#include "runner_utils.h"

#include "seqrun/config.h"
#include "seqrun/queue.h"

#include <iostream>
#include <string>
#include <vector>

using namespace seqrun;

int cmd_add(int argc, char** argv) {
    std::string command;
    std::string name;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--name" && i + 1 < argc) { name = argv[++i]; continue; }
        if (command.empty()) { command = a; continue; }
        std::cerr << "add: unexpected argument: " << a << " (quote the command)\n";
        return kExitUsage;
    }
    if (command.empty()) {
        std::cerr << "usage: seqrun add <command> [--name NAME]\n";
        return kExitUsage;
    }

    JobQueue q(load_config());
    JobId id = q.add_job(command, name);
    std::cout << id << "\n";
    return kExitOk;
}

int cmd_status(int argc, char** argv) {
    std::string id;
    bool as_json = false;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--json") { as_json = true; continue; }
        if (id.empty() && !a.empty() && a[0] != '-') { id = a; continue; }
        std::cerr << "usage: seqrun status [<job_id>] [--json]\n";
        return kExitUsage;
    }

    JobQueue q(load_config());
    if (!id.empty()) {
        auto job = q.get_job(id);
        if (!job) {
            std::cerr << "error: job " << id << " not found\n";
            return kExitRefused;
        }
        if (as_json) std::cout << job_json_text(*job) << "\n";
        else print_job_detail(std::cout, *job);
        return kExitOk;
    }

    auto jobs = q.get_status();
    if (as_json) std::cout << jobs_json_text(jobs) << "\n";
    else print_job_table(std::cout, jobs);
    return kExitOk;
}

int cmd_remove(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: seqrun remove <job_id>\n";
        return kExitUsage;
    }
    const std::string id = argv[2];
    JobQueue q(load_config());
    std::string reason;
    if (!q.remove_job(id, &reason)) {
        std::cerr << "error: could not remove job " << id << ": " << reason << "\n";
        return kExitRefused;
    }
    std::cout << "Removed job " << id << "\n";
    return kExitOk;
}

int cmd_stop(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: seqrun stop <job_id>\n";
        return kExitUsage;
    }
    const std::string id = argv[2];
    JobQueue q(load_config());
    std::string reason;
    if (!q.stop_job(id, &reason)) {
        std::cerr << "error: could not stop job " << id << ": " << reason << "\n";
        return kExitRefused;
    }
    std::cout << "Stopped job " << id << "\n";
    return kExitOk;
}

int cmd_clear(int argc, char** argv) {
    (void)argv;
    if (argc != 2) {
        std::cerr << "usage: seqrun clear\n";
        return kExitUsage;
    }
    JobQueue q(load_config());
    size_t n = q.clear_finished();
    std::cout << "Cleared " << n << " finished job" << (n == 1 ? "" : "s") << "\n";
    return kExitOk;
}

int cmd_logs(int argc, char** argv) {
    int lines = 20;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        std::string val;
        if ((a == "--lines" || a == "-n") && i + 1 < argc) val = argv[++i];
        else val = a;
        auto n = parse_int_arg(val);
        if (!n || *n < 0) {
            std::cerr << "usage: seqrun logs [--lines N]\n";
            return kExitUsage;
        }
        lines = *n;
    }

    JobQueue q(load_config());
    for (const auto& line : q.tail_log((size_t)lines)) std::cout << line << "\n";
    return kExitOk;
}

int cmd_joblog(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: seqrun joblog <job_id>\n";
        return kExitUsage;
    }
    const std::string id = argv[2];
    const QueueConfig cfg = load_config();
    const auto path = cfg.job_log_path(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::cerr << "error: no output log for job " << id << " (" << path.string() << ")\n";
        return kExitRefused;
    }
    std::cout << slurp_file(path.string());
    return kExitOk;
}
