#include "test_common.h"

#include "seqrun/queue.h"

#include <set>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace seqrun;

// Many processes adding at once must not lose a job or share an id.
int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_test_dir("concurrent_add");
    const QueueConfig cfg = QueueConfig::for_home(dir);

    constexpr int kProcs = 8;
    constexpr int kPerProc = 10;

    std::vector<pid_t> kids;
    for (int p = 0; p < kProcs; p++) {
        pid_t pid = ::fork();
        if (pid < 0) die("fork failed");
        if (pid == 0) {
            try {
                JobQueue q(cfg);
                for (int i = 0; i < kPerProc; i++) {
                    q.add_job("echo " + std::to_string(p) + "-" + std::to_string(i));
                }
            } catch (const std::exception& e) {
                std::cerr << "child: " << e.what() << std::endl;
                ::_exit(1);
            }
            ::_exit(0);
        }
        kids.push_back(pid);
    }
    for (pid_t pid : kids) {
        int st = 0;
        ::waitpid(pid, &st, 0);
        expect_true(WIFEXITED(st) && WEXITSTATUS(st) == 0, "child add loop succeeded");
    }

    JobQueue q(cfg);
    auto jobs = q.get_status();
    expect_eq_ll((long long)jobs.size(), kProcs * kPerProc, "no lost adds");
    std::set<JobId> ids;
    std::set<std::string> commands;
    for (const auto& j : jobs) {
        ids.insert(j.id);
        commands.insert(j.command);
        expect_true(j.status == JobStatus::PENDING, "all pending");
    }
    expect_eq_ll((long long)ids.size(), kProcs * kPerProc, "ids unique across processes");
    expect_eq_ll((long long)commands.size(), kProcs * kPerProc, "every command stored once");
    expect_eq_ll((long long)q.tail_log(1000).size(), kProcs * kPerProc, "one audit line per add");

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_concurrent_add: ALL PASSED" << std::endl;
    return 0;
}
