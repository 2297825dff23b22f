#include "platform/linux/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

struct Pipe {
    int read_end = -1;
    int write_end = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) return false;
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int release_read() { int fd = read_end; read_end = -1; return fd; }
    int release_write() { int fd = write_end; write_end = -1; return fd; }

    ~Pipe() {
        close_fd(read_end);
        close_fd(write_end);
    }
};

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Runs in the forked child only; async-signal-safe calls from here on.
[[noreturn]] void exec_child(char* const* argv, const SpawnOptions& options,
                             int in_fd, int out_fd, int err_fd, int report_fd) {
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    ::dup2(in_fd >= 0 ? in_fd : devnull, STDIN_FILENO);
    ::dup2(out_fd >= 0 ? out_fd : devnull, STDOUT_FILENO);
    ::dup2(err_fd >= 0 ? err_fd : devnull, STDERR_FILENO);

    if (!options.workdir.empty() && ::chdir(options.workdir.c_str()) < 0) {
        int err = errno;
        (void)!::write(report_fd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvp(argv[0], argv);

    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(127);
}

} // namespace

ExitStatus ExitStatus::from_wait_status(int status) {
    if (WIFSIGNALED(status)) {
        return {.kind = Kind::Signaled, .code = WTERMSIG(status)};
    }
    return {.kind = Kind::Exited, .code = WIFEXITED(status) ? WEXITSTATUS(status) : -1};
}

std::string ExitStatus::describe() const {
    if (kind == Kind::Signaled) {
        const char* name = ::strsignal(code);
        return std::format("killed by signal {} ({})", code, name ? name : "unknown");
    }
    return std::format("exited with code {}", code);
}

bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::expected<ChildProcess, std::string>
spawn_process(const std::vector<std::string>& argv, const SpawnOptions& options) {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected("empty command line");
    }

    // Build argv before forking: no allocation in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
    cargv.push_back(nullptr);

    Pipe in, out, err, report;
    if ((options.pipe_stdin && !in.open()) ||
        (options.pipe_stdout && !out.open()) ||
        (options.pipe_stderr && !err.open()) ||
        !report.open()) {
        return std::unexpected(errno_message("pipe2()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        exec_child(cargv.data(), options, in.read_end, out.write_end, err.write_end,
                   report.write_end);
    }

    // Parent: drop the child's ends so EOF propagates.
    Pipe::close_fd(in.read_end);
    Pipe::close_fd(out.write_end);
    Pipe::close_fd(err.write_end);
    Pipe::close_fd(report.write_end);

    // The report pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report.read_end, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)wait_process(pid);
        return std::unexpected(std::format("{}: {}", argv.front(), std::strerror(child_errno)));
    }

    return ChildProcess{
        .pid = pid,
        .stdin_fd = in.release_write(),
        .stdout_fd = out.release_read(),
        .stderr_fd = err.release_read(),
    };
}

std::expected<ExitStatus, std::string> wait_process(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }
    return ExitStatus::from_wait_status(status);
}

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::string_view input,
            const std::string& workdir) {
    auto child = spawn_process(argv, SpawnOptions{
        .pipe_stdin = true,
        .pipe_stdout = true,
        .pipe_stderr = true,
        .workdir = workdir,
    });
    if (!child) return std::unexpected(child.error());

    ProcessResult result;
    int in_fd = child->stdin_fd;
    int out_fd = child->stdout_fd;
    int err_fd = child->stderr_fd;
    size_t written = 0;

    if (input.empty()) Pipe::close_fd(in_fd);
    else set_nonblocking(in_fd);

    std::string io_error;
    while (in_fd >= 0 || out_fd >= 0 || err_fd >= 0) {
        pollfd pfds[3];
        int count = 0;
        if (in_fd >= 0) pfds[count++] = {.fd = in_fd, .events = POLLOUT, .revents = 0};
        if (out_fd >= 0) pfds[count++] = {.fd = out_fd, .events = POLLIN, .revents = 0};
        if (err_fd >= 0) pfds[count++] = {.fd = err_fd, .events = POLLIN, .revents = 0};

        if (::poll(pfds, count, -1) < 0) {
            if (errno == EINTR) continue;
            io_error = errno_message("poll()");
            break;
        }

        for (int i = 0; i < count; i++) {
            if (pfds[i].revents == 0) continue;
            int fd = pfds[i].fd;

            if (fd == in_fd) {
                ssize_t n = ::write(in_fd, input.data() + written, input.size() - written);
                if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
                if (n < 0) {
                    // Child stopped reading (EPIPE); its exit status tells the rest.
                    Pipe::close_fd(in_fd);
                    continue;
                }
                written += static_cast<size_t>(n);
                if (written == input.size()) Pipe::close_fd(in_fd);
                continue;
            }

            char buf[4096];
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                if (fd == out_fd) Pipe::close_fd(out_fd);
                else Pipe::close_fd(err_fd);
                continue;
            }
            (fd == out_fd ? result.out : result.err).append(buf, static_cast<size_t>(n));
        }
    }

    Pipe::close_fd(in_fd);
    Pipe::close_fd(out_fd);
    Pipe::close_fd(err_fd);

    auto status = wait_process(child->pid);
    if (!status) return std::unexpected(status.error());
    if (!io_error.empty()) return std::unexpected(io_error);

    result.status = *status;
    return result;
}
