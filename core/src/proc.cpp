#include "seqrun/proc.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>

#include <csignal>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace seqrun {

namespace {

constexpr int kPollSliceMs = 20;

// What the child reports over the close-on-exec pipe when it cannot exec.
struct ExecFailure {
    int stage;  // 1 = chdir, 2 = stdio setup, 3 = exec
    int err;
};

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// environ minus loader overrides, built before fork so the child does not
// allocate
std::vector<std::string> filtered_environment() {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; e++) {
        std::string kv = *e;
        if (kv.rfind("LD_PRELOAD=", 0) == 0) continue;
        if (kv.rfind("LD_LIBRARY_PATH=", 0) == 0) continue;
        out.push_back(std::move(kv));
    }
    return out;
}

[[noreturn]] void child_fail(int fd, int stage, int err) {
    ExecFailure f{stage, err};
    ssize_t n;
    do {
        n = ::write(fd, &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
    _exit(127);
}

} // namespace

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

bool pid_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

#ifdef __linux__
// Boot time in epoch seconds, from the btime line of /proc/stat.
static std::optional<int64_t> boot_time_s() {
    std::ifstream f("/proc/stat");
    std::string key;
    while (f >> key) {
        if (key == "btime") {
            int64_t v = 0;
            if (f >> v) return v;
            return std::nullopt;
        }
        f.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    return std::nullopt;
}

// pgrp and start time (ticks since boot) of one process from /proc/<pid>/stat.
static bool read_proc_stat(const std::filesystem::path& stat_path, pid_t* pgrp, uint64_t* start_ticks) {
    std::ifstream f(stat_path);
    std::string line;
    if (!std::getline(f, line)) return false;
    // comm may contain spaces and parentheses; fields resume after the last ')'
    size_t rp = line.rfind(')');
    if (rp == std::string::npos) return false;
    std::istringstream rest(line.substr(rp + 1));
    std::vector<std::string> fields;
    std::string tok;
    while (rest >> tok) fields.push_back(tok);
    // fields[0] is state (field 3): pgrp is field 5, starttime field 22
    if (fields.size() < 20) return false;
    try {
        *pgrp = (pid_t)std::stol(fields[2]);
        *start_ticks = std::stoull(fields[19]);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
#endif

bool group_started_since(pid_t pgid, int64_t since_ms) {
    if (pgid <= 1) return false;
    if (::kill(-pgid, 0) != 0 && errno != EPERM) return false;

#ifdef __linux__
    auto btime = boot_time_s();
    const long hz = sysconf(_SC_CLK_TCK);
    if (!btime || hz <= 0) return true;

    constexpr int64_t kSlackMs = 1000;
    bool found = false;
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = e.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
        pid_t pgrp = 0;
        uint64_t ticks = 0;
        if (!read_proc_stat(e.path() / "stat", &pgrp, &ticks)) continue;  // exited meanwhile
        if (pgrp != pgid) continue;
        found = true;
        const int64_t started_ms = *btime * 1000 + (int64_t)(ticks * 1000 / (uint64_t)hz);
        if (started_ms + kSlackMs < since_ms) return false;
    }
    if (ec) return true;
    return found;
#else
    (void)since_ms;
    return true;
#endif
}

bool kill_process_group(pid_t pgid, int grace_ms) {
    if (pgid <= 1) return false;
    if (::kill(-pgid, SIGTERM) != 0) {
        if (errno == ESRCH) return true;  // already gone
        if (errno == EPERM) return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (::kill(-pgid, 0) != 0 && errno == ESRCH) return true;
        sleep_ms(kPollSliceMs);
    }

    if (::kill(-pgid, SIGKILL) != 0) {
        return errno == ESRCH;
    }
    // SIGKILL cannot be caught; give the kernel a moment to tear down
    for (int i = 0; i < 50; i++) {
        if (::kill(-pgid, 0) != 0 && errno == ESRCH) break;
        sleep_ms(kPollSliceMs);
    }
    return true;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped_) {
        (void)::kill(-pid_, SIGKILL);
        (void)::kill(pid_, SIGKILL);
        (void)wait();
    }
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      reaped_(std::exchange(other.reaped_, false)),
      exit_code_(std::exchange(other.exit_code_, 0)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !reaped_) {
            (void)::kill(-pid_, SIGKILL);
            (void)wait();
        }
        pid_ = std::exchange(other.pid_, -1);
        reaped_ = std::exchange(other.reaped_, false);
        exit_code_ = std::exchange(other.exit_code_, 0);
    }
    return *this;
}

std::string ChildProcess::spawn(const ShellSpec& shell,
                                const std::string& command,
                                const std::filesystem::path& output_path,
                                const std::filesystem::path& cwd) {
    if (pid_ > 0) return "process already spawned";
    if (shell.path.empty()) return "empty shell path";

    int out_fd = ::open(output_path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (out_fd < 0) {
        return "open " + output_path.string() + ": " + std::strerror(errno);
    }
    int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        std::string err = std::string("open /dev/null: ") + std::strerror(errno);
        ::close(out_fd);
        return err;
    }

    int errpipe[2];
    if (pipe(errpipe) != 0) {
        std::string err = std::string("pipe failed: ") + std::strerror(errno);
        ::close(out_fd);
        ::close(null_fd);
        return err;
    }
    set_cloexec(errpipe[0]);
    set_cloexec(errpipe[1]);

    // everything the child needs is prepared before fork
    std::vector<std::string> argv_s{shell.path};
    if (!shell.flag.empty()) argv_s.push_back(shell.flag);
    argv_s.push_back(command);
    std::vector<char*> cargv;
    cargv.reserve(argv_s.size() + 1);
    for (const auto& s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_s = filtered_environment();
    std::vector<char*> cenv;
    cenv.reserve(env_s.size() + 1);
    for (const auto& s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    const std::string cwd_s = cwd.string();
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = std::string("fork failed: ") + std::strerror(errno);
        ::close(out_fd);
        ::close(null_fd);
        ::close(errpipe[0]);
        ::close(errpipe[1]);
        return err;
    }

    if (pid == 0) {
        // child
        if (dup2(null_fd, STDIN_FILENO) < 0 ||
            dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(out_fd, STDERR_FILENO) < 0) {
            child_fail(errpipe[1], 2, errno);
        }

        // own process group so a stop reaches the whole subtree
        (void)setpgid(0, 0);

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        // best-effort: close inherited fds beyond stdio, keep the error pipe
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd == errpipe[1]) continue;
            (void)close(fd);
        }

        // default dispositions for the job, whatever the worker installed
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);

        if (!cwd_s.empty() && chdir(cwd_s.c_str()) != 0) {
            child_fail(errpipe[1], 1, errno);
        }

        environ = cenv.data();
        execvp(cargv[0], cargv.data());
        child_fail(errpipe[1], 3, errno);
    }

    // parent
    (void)setpgid(pid, pid);
    ::close(out_fd);
    ::close(null_fd);
    ::close(errpipe[1]);

    pid_ = pid;
    reaped_ = false;

    ExecFailure f{0, 0};
    ssize_t n;
    do {
        n = ::read(errpipe[0], &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
    ::close(errpipe[0]);

    if (n == (ssize_t)sizeof(f)) {
        // exec never happened: reap and report
        (void)wait();
        pid_ = -1;
        reaped_ = false;
        std::string err;
        switch (f.stage) {
            case 1:  err = "chdir " + cwd_s; break;
            case 2:  err = "dup2"; break;
            default: err = "exec " + shell.path; break;
        }
        return err + ": " + std::strerror(f.err);
    }
    return "";
}

bool ChildProcess::try_wait(int* exit_code) {
    if (pid_ <= 0) return false;
    if (!reaped_) {
        int status = 0;
        pid_t w;
        do {
            w = waitpid(pid_, &status, WNOHANG);
        } while (w < 0 && errno == EINTR);
        if (w == 0) return false;
        reaped_ = true;
        exit_code_ = (w == pid_) ? decode_wait_status(status) : 128;
    }
    if (exit_code) *exit_code = exit_code_;
    return true;
}

int ChildProcess::wait() {
    if (pid_ <= 0) return exit_code_;
    if (!reaped_) {
        int status = 0;
        pid_t w;
        do {
            w = waitpid(pid_, &status, 0);
        } while (w < 0 && errno == EINTR);
        reaped_ = true;
        exit_code_ = (w == pid_) ? decode_wait_status(status) : 128;
    }
    return exit_code_;
}

int ChildProcess::terminate(int grace_ms) {
    if (pid_ <= 0) return exit_code_;
    int code = 0;
    if (try_wait(&code)) {
        // leader gone; sweep anything left in its group
        (void)::kill(-pid_, SIGKILL);
        return code;
    }

    (void)::kill(-pid_, SIGTERM);
    (void)::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_wait(&code)) {
            (void)::kill(-pid_, SIGKILL);
            return code;
        }
        sleep_ms(kPollSliceMs);
    }

    (void)::kill(-pid_, SIGKILL);
    (void)::kill(pid_, SIGKILL);
    return wait();
}

} // namespace seqrun
