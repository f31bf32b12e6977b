#include "cmd_queue.h"
#include "cmd_worker.h"
#include "runner_utils.h"

#include "seqrun/config.h"
#include "seqrun/serialization.h"

#include <iostream>
#include <stdexcept>
#include <string>

static void usage() {
    std::cerr << "seqrun <command> ...\n"
              << "  add <command> [--name NAME]   enqueue a shell command, prints its id\n"
              << "  status [<job_id>] [--json]    show one job or the whole queue\n"
              << "  remove <job_id>               remove a pending job\n"
              << "  stop <job_id>                 stop a running job\n"
              << "  worker [--poll_ms N]          run queued jobs until interrupted\n"
              << "  clear                         drop completed/failed/stopped jobs\n"
              << "  logs [--lines N]              tail the queue event log\n"
              << "  joblog <job_id>               print a job's captured output\n"
              << "env: SEQRUN_HOME, SEQRUN_PROFILE=dev|prod, SEQRUN_POLL_MS, SEQRUN_STOP_GRACE_MS,\n"
              << "     SEQRUN_FSYNC, SEQRUN_SHELL\n";
}

static int dispatch(const std::string& cmd, int argc, char** argv) {
    if (cmd == "add") return cmd_add(argc, argv);
    if (cmd == "status") return cmd_status(argc, argv);
    if (cmd == "remove") return cmd_remove(argc, argv);
    if (cmd == "stop") return cmd_stop(argc, argv);
    if (cmd == "worker") return cmd_worker(argc, argv);
    if (cmd == "clear") return cmd_clear(argc, argv);
    if (cmd == "logs") return cmd_logs(argc, argv);
    if (cmd == "joblog") return cmd_joblog(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    usage();
    return seqrun::kExitUsage;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return seqrun::kExitUsage;
    }
    std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        usage();
        return seqrun::kExitOk;
    }

    seqrun::apply_profile_defaults(seqrun::detect_profile());

    try {
        return dispatch(cmd, argc, argv);
    } catch (const seqrun::StoreCorruption& e) {
        std::cerr << "error: queue file is unreadable, refusing to continue: " << e.what() << "\n";
        return seqrun::kExitFatal;
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        return seqrun::kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return seqrun::kExitFatal;
    }
}
