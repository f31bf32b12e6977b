#include "test_common.h"

#include "seqrun/proc.h"
#include "seqrun/types.h"

#include <chrono>
#include <csignal>
#include <fstream>
#include <sstream>

using namespace seqrun;

static std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static int run_to_end(const std::string& cmd, const std::filesystem::path& out) {
    ChildProcess c;
    std::string err = c.spawn(ShellSpec{}, cmd, out);
    expect_true(err.empty(), "spawn '" + cmd + "': " + err);
    return c.wait();
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_test_dir("proc");
    fs::path out = dir / "out.log";

    // stdout and stderr both land in the output file, appended
    {
        std::ofstream f(out);
        f << "header\n";
    }
    expect_eq_ll(run_to_end("echo hello; echo oops 1>&2", out), 0, "exit 0");
    std::string text = read_file(out);
    expect_true(text.rfind("header\n", 0) == 0, "output appended after existing content");
    expect_true(text.find("hello\n") != std::string::npos, "stdout captured");
    expect_true(text.find("oops\n") != std::string::npos, "stderr captured");

    expect_eq_ll(run_to_end("exit 3", out), 3, "nonzero exit code");
    expect_eq_ll(run_to_end("definitely-not-a-command-xyz", out), 127, "unknown command via shell");
    expect_eq_ll(run_to_end("kill -9 $$", out), 128 + SIGKILL, "signal death -> 128+sig");
    expect_eq_ll(run_to_end("read x; echo \"got[$x]\"", out), 0, "stdin is /dev/null");
    expect_true(read_file(out).find("got[]") != std::string::npos, "read saw EOF");

    // working directory
    {
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "pwd", dir / "pwd.log", dir);
        expect_true(err.empty(), "spawn pwd: " + err);
        expect_eq_ll(c.wait(), 0, "pwd exit");
        expect_true(read_file(dir / "pwd.log").find(fs::canonical(dir).string()) != std::string::npos,
                    "child runs in the requested cwd");
    }

    // spawn failures are reported, not turned into exit codes
    {
        ChildProcess c;
        ShellSpec bad;
        bad.path = "/nonexistent/shell";
        std::string err = c.spawn(bad, "echo x", out);
        expect_true(!err.empty(), "missing shell is a spawn error");
        expect_true(err.find("exec") != std::string::npos, "error names the exec stage: " + err);
        expect_true(!c.started(), "no child recorded after failed exec");
    }
    {
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "echo x", dir / "missing_dir" / "out.log");
        expect_true(!err.empty(), "unwritable output is a spawn error");
    }

    // try_wait is non-blocking
    {
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "sleep 0.3", out);
        expect_true(err.empty(), "spawn sleep: " + err);
        int code = -1;
        expect_true(!c.try_wait(&code), "still running");
        expect_true(pid_alive(c.pid()), "pid alive while running");
        expect_true(wait_until([&] { return c.try_wait(&code); }, 5000), "exits eventually");
        expect_eq_ll(code, 0, "sleep exit code");
        expect_true(c.exited(), "exited flag");
    }

    // terminate: polite stop
    {
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "sleep 30", out);
        expect_true(err.empty(), "spawn sleep 30: " + err);
        pid_t pid = c.pid();
        auto t0 = std::chrono::steady_clock::now();
        int code = c.terminate(2000);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_eq_ll(code, 128 + SIGTERM, "terminated by SIGTERM");
        expect_true(ms < 2000, "SIGTERM was enough, no grace wait");
        expect_true(!pid_alive(pid), "process gone");
    }

    // terminate: SIGTERM ignored, SIGKILL after grace; grandchildren die with the group
    {
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "trap '' TERM; sleep 30 & echo $! > " +
                                  (dir / "grandchild.pid").string() + "; wait", out);
        expect_true(err.empty(), "spawn trap: " + err);
        expect_true(wait_until([&] { return fs::exists(dir / "grandchild.pid") &&
                                            fs::file_size(dir / "grandchild.pid") > 0; }, 5000),
                    "grandchild started");
        pid_t grandchild = (pid_t)std::stol(read_file(dir / "grandchild.pid"));
        auto t0 = std::chrono::steady_clock::now();
        int code = c.terminate(300);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(ms >= 300, "waited the grace period");
        expect_true(code == 128 + SIGKILL || code == 128 + SIGTERM, "killed by signal");
        expect_true(wait_until([&] { return !pid_alive(grandchild); }, 3000), "grandchild killed with the group");
    }

    // kill_process_group for a group we did not wait on
    {
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "sleep 30", out);
        expect_true(err.empty(), "spawn: " + err);
        expect_true(kill_process_group(c.pid(), 1000), "group killed");
        expect_eq_ll(c.wait(), 128 + SIGTERM, "leader saw SIGTERM");
    }
    expect_true(!kill_process_group(1, 0), "refuses pgid 1");

    // group ownership: a group is only attributed to a record it could belong to
    {
        const int64_t before = now_ms();
        ChildProcess c;
        std::string err = c.spawn(ShellSpec{}, "sleep 30", out);
        expect_true(err.empty(), "spawn: " + err);
        expect_true(group_started_since(c.pid(), before), "fresh group belongs to a record started before it");
        expect_true(!group_started_since(c.pid(), now_ms() + 60000),
                    "group older than the record is someone else's");
        const pid_t pgid = c.pid();
        (void)c.terminate(1000);
        expect_true(wait_until([&] { return !group_started_since(pgid, before); }, 3000),
                    "vanished group belongs to nobody");
    }
    expect_true(!group_started_since(1, 0), "pgid 1 is never a job's");

    expect_eq_ll(decode_wait_status(0), 0, "status 0");
    expect_true(!pid_alive(0) && !pid_alive(-5), "non-positive pids are never alive");

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
