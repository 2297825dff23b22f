#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

struct ExitStatus {
    enum class Kind { Exited, Signaled };

    Kind kind = Kind::Exited;
    int code = 0; // exit code, or signal number when Signaled

    static ExitStatus from_wait_status(int status);

    bool success() const { return kind == Kind::Exited && code == 0; }

    // "exited with code 1", "killed by signal 9 (Killed)"
    std::string describe() const;
};

struct SpawnOptions {
    bool pipe_stdin = false;  // otherwise /dev/null
    bool pipe_stdout = false; // otherwise /dev/null
    bool pipe_stderr = false; // otherwise /dev/null
    std::string workdir;      // empty: inherit
};

// Parent-side ends of the pipes requested in SpawnOptions (-1 when not piped).
// All descriptors are close-on-exec; the caller owns them.
struct ChildProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

struct ProcessResult {
    ExitStatus status;
    std::string out;
    std::string err;
};

// fork + execvp. The child starts with an empty signal mask so that signals
// the parent routes through signalfd still reach it. An exec failure is
// reported here ("tmux: No such file or directory") rather than as exit 127.
std::expected<ChildProcess, std::string>
spawn_process(const std::vector<std::string>& argv, const SpawnOptions& options = {});

// Blocking wait, retried on EINTR.
std::expected<ExitStatus, std::string> wait_process(pid_t pid);

// Run to completion, feeding `input` on stdin and collecting stdout/stderr.
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::string_view input = {},
            const std::string& workdir = {});

bool set_nonblocking(int fd);
