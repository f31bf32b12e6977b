#include "test_common.h"

#include "seqrun/proc.h"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <sstream>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

// Built path of the seqrun_pidwait executable, set by the build.
#ifndef SEQRUN_PIDWAIT_BIN
#error "SEQRUN_PIDWAIT_BIN must point at the seqrun_pidwait executable"
#endif

using namespace seqrun;

static std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// The single pidwait log written under home, or empty if none yet.
static std::filesystem::path find_log(const std::filesystem::path& home) {
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(home / "pidwait_logs", ec)) {
        if (e.path().extension() == ".log") return e.path();
    }
    return {};
}

static pid_t start_pidwait(const std::filesystem::path& home, pid_t target, const std::string& command) {
    pid_t pid = ::fork();
    if (pid < 0) die("fork failed");
    if (pid == 0) {
        setenv("SEQRUN_HOME", home.c_str(), 1);
        setenv("SEQRUN_STOP_GRACE_MS", "500", 1);
        const std::string target_s = std::to_string(target);
        execl(SEQRUN_PIDWAIT_BIN, SEQRUN_PIDWAIT_BIN, target_s.c_str(), command.c_str(), (char*)nullptr);
        _exit(126);
    }
    return pid;
}

static int wait_exit(pid_t pid) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    return decode_wait_status(st);
}

// A pid that existed a moment ago and is now gone.
static pid_t exited_pid() {
    pid_t pid = ::fork();
    if (pid < 0) die("fork failed");
    if (pid == 0) _exit(0);
    (void)wait_exit(pid);
    return pid;
}

int main() {
    namespace fs = std::filesystem;

    // target already gone: runs the command and exits with its code
    {
        fs::path home = fresh_test_dir("pidwait_run");
        pid_t pw = start_pidwait(home, exited_pid(), "echo follow-up; exit 5");
        expect_eq_ll(wait_exit(pw), 5, "exit code of the command");
        fs::path log = find_log(home);
        expect_true(!log.empty(), "log file written");
        std::string text = read_file(log);
        expect_true(text.find("waiting for PID") != std::string::npos, "started line");
        expect_true(text.find("follow-up") != std::string::npos, "command output in the log");
        expect_true(text.find("completed: exit code 5") != std::string::npos, "completed line");
        std::error_code ec;
        fs::remove_all(home, ec);
    }

    // waits while the target lives
    {
        fs::path home = fresh_test_dir("pidwait_wait");
        ChildProcess target;
        std::string err = target.spawn(ShellSpec{}, "sleep 1", home / "target.log");
        expect_true(err.empty(), "spawn target: " + err);
        pid_t pw = start_pidwait(home, target.pid(), "echo ran > " + (home / "ran.txt").string());
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        expect_true(!fs::exists(home / "ran.txt"), "command not run while the target lives");
        expect_eq_ll(target.wait(), 0, "target exits");  // reaped, so kill(pid, 0) now fails
        expect_eq_ll(wait_exit(pw), 0, "pidwait exit code");
        expect_true(fs::exists(home / "ran.txt"), "command ran after the target exited");
        std::error_code ec;
        fs::remove_all(home, ec);
    }

    // an interrupt while the command runs stops the command's whole group
    {
        fs::path home = fresh_test_dir("pidwait_interrupt");
        fs::path pid_file = home / "cmd.pid";
        pid_t pw = start_pidwait(home, exited_pid(),
                                 "echo $$ > " + pid_file.string() + "; sleep 30; echo not-reached");
        expect_true(wait_until([&] { return fs::exists(pid_file) && fs::file_size(pid_file) > 0; }, 10000),
                    "command started");
        const pid_t cmd_pgid = (pid_t)std::stol(read_file(pid_file));

        expect_eq_ll(::kill(pw, SIGTERM), 0, "signal pidwait");
        const int code = wait_exit(pw);
        expect_true(code >= 128, "exit code reports the signal death of the command");
        expect_true(wait_until([&] { return ::kill(-cmd_pgid, 0) != 0; }, 3000),
                    "command group gone once pidwait returned");
        std::string text = read_file(find_log(home));
        expect_true(text.find("interrupted, stopped command") != std::string::npos, "interrupt logged");
        expect_true(text.find("not-reached") == std::string::npos, "command did not run to the end");
        std::error_code ec;
        fs::remove_all(home, ec);
    }

    std::cerr << "test_pidwait: ALL PASSED" << std::endl;
    return 0;
}
