#include "cmd_worker.h"
#include "runner_utils.h"

#include "seqrun/config.h"
#include "seqrun/queue.h"
#include "seqrun/worker.h"

#include <atomic>
#include <csignal>
#include <iostream>

using namespace seqrun;

static std::atomic<bool> g_worker_running{true};

int cmd_worker(int argc, char** argv) {
    QueueConfig cfg = load_config();
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--poll_ms" && i + 1 < argc) {
            auto v = parse_int_arg(argv[++i]);
            if (!v || *v < 10) {
                std::cerr << "worker: --poll_ms must be an integer >= 10\n";
                return kExitUsage;
            }
            cfg.poll_ms = *v;
            continue;
        }
        std::cerr << "usage: seqrun worker [--poll_ms N]\n";
        return kExitUsage;
    }

    // Install signal handlers for graceful shutdown
    g_worker_running.store(true);
    std::signal(SIGTERM, [](int) { g_worker_running.store(false); });
    std::signal(SIGINT,  [](int) { g_worker_running.store(false); });
    std::signal(SIGPIPE, SIG_IGN);

    JobQueue q(cfg);
    Worker w(q);
    int rc = w.run(g_worker_running);
    return rc == 0 ? kExitOk : kExitRefused;
}
