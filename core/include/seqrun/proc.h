#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace seqrun {

// The execution boundary: a command string is only ever run as
// `<path> <flag> <command>`.
struct ShellSpec {
    std::string path{"/bin/sh"};
    std::string flag{"-c"};
};

// Exit code for a waitpid() status: WEXITSTATUS, or 128 + signal number.
int decode_wait_status(int status);

// kill(pid, 0) probe. EPERM counts as alive.
bool pid_alive(pid_t pid);

// True if process group pgid exists and none of its members is older than
// since_ms (epoch ms, one second of slack for /proc granularity). A group
// recorded by a dead worker may have vanished and its id been reused; this
// tells the two apart before anything is signalled. Without /proc only
// existence is checked.
bool group_started_since(pid_t pgid, int64_t since_ms);

// Stop a process group this process did not spawn (no waitpid possible):
// SIGTERM, poll for up to grace_ms, then SIGKILL. Returns true once the
// group leader is gone.
bool kill_process_group(pid_t pgid, int grace_ms);

// ChildProcess: owns one spawned child running in its own process group.
//
// The handle is never shared; other processes only see the pid recorded in
// the queue. A ChildProcess destroyed while its child is alive kills the
// whole group and reaps it.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // Runs `shell.path shell.flag command` with stdout+stderr appended to
    // output_path, stdin from /dev/null, working directory cwd (empty = ours).
    // Returns empty string on success, else the spawn error (fork failure,
    // output file not writable, shell not executable).
    std::string spawn(const ShellSpec& shell,
                      const std::string& command,
                      const std::filesystem::path& output_path,
                      const std::filesystem::path& cwd = {});

    pid_t pid() const { return pid_; }
    bool started() const { return pid_ > 0; }
    bool exited() const { return reaped_; }

    // Non-blocking. Returns true once the child has exited; *exit_code is
    // then set.
    bool try_wait(int* exit_code);

    // Blocks until exit. Returns the exit code.
    int wait();

    // Graceful then forceful: SIGTERM to the group, wait up to grace_ms,
    // SIGKILL, reap. Bounded by grace_ms plus the reap. Returns the exit code
    // (128 + signal when killed).
    int terminate(int grace_ms);

private:
    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = 0;
};

} // namespace seqrun
