#include "transcript_session.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <print>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

TranscriptSession::TranscriptSession(FdWatcher& watcher, std::string program,
                                     std::vector<std::string> args, bool verbose)
    : watcher_(watcher), program_(std::move(program)), args_(std::move(args)),
      verbose_(verbose) {}

TranscriptSession::~TranscriptSession() {
    shutdown();
}

void TranscriptSession::set_fault_handler(FaultHandler handler) {
    supervisor_.set_handler(std::move(handler));
}

std::vector<std::string> TranscriptSession::build_command(const RecognizerOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args_.size() + 7);
    argv.push_back(program_);
    argv.insert(argv.end(), args_.begin(), args_.end());
    argv.push_back("--model");
    argv.push_back(options.model_path);
    argv.push_back("--sample-rate");
    argv.push_back(std::to_string(options.sample_rate));
    if (!options.device.empty()) {
        argv.push_back("--device");
        argv.push_back(options.device);
    }
    return argv;
}

std::expected<void, std::string> TranscriptSession::start(const RecognizerOptions& options) {
    if (is_active()) {
        return std::unexpected("a recognition session is already active");
    }

    std::error_code ec;
    if (options.model_path.empty() || !fs::exists(options.model_path, ec)) {
        return std::unexpected("model path not found: " + options.model_path);
    }

    // A stopped session may still be flushing; cut it loose before the new one.
    if (active_) retire_active();

    auto child = spawn_process(build_command(options),
                               SpawnOptions{.pipe_stdout = true, .pipe_stderr = true});
    if (!child) {
        std::println(stderr, "session: {}", child.error());
        return std::unexpected("failed to start recognizer: " + child.error());
    }

    set_nonblocking(child->stdout_fd);
    set_nonblocking(child->stderr_fd);

    uint64_t id = next_id_++;
    active_ = std::make_unique<ActiveSession>(
        SessionHandle{
            .id = id,
            .pid = child->pid,
            .stdout_fd = child->stdout_fd,
            .stderr_fd = child->stderr_fd,
        },
        [this](const TranscriptEvent& event) { feed_result(event); });

    if (!watcher_.watch(child->stdout_fd, [this, id] { on_stdout_readable(id); }) ||
        !watcher_.watch(child->stderr_fd, [this, id] { on_stderr_readable(id); })) {
        ::kill(child->pid, SIGKILL);
        close_stdout();
        close_stderr();
        active_.reset();
        (void)wait_process(child->pid);
        return std::unexpected("failed to watch recognizer output");
    }

    supervisor_.session_started(id);
    log(std::format("recognizer started (pid {}, model {}, {} Hz)", child->pid,
                    options.model_path, options.sample_rate));
    return {};
}

void TranscriptSession::stop() {
    if (!active_ || active_->handle.stop_requested) return;

    auto& handle = active_->handle;
    handle.stop_requested = true;
    supervisor_.stop_requested(handle.id);

    if (::kill(handle.pid, SIGTERM) < 0 && errno != ESRCH) {
        std::println(stderr, "session: kill({}) failed: {}", handle.pid, std::strerror(errno));
    }
    log(std::format("recognizer stop requested (pid {})", handle.pid));
}

void TranscriptSession::feed_result(const TranscriptEvent& event) {
    if (event.type == TranscriptEventType::Error) {
        if (active_) active_->handle.last_error = event.text;
        log("recognizer error: " + event.text);
    } else if (event.type == TranscriptEventType::Final) {
        log("final: " + event.text);
    }

    if (on_event_) on_event_(event);
}

void TranscriptSession::on_stdout_readable(uint64_t id) {
    char buf[4096];

    while (active_ && active_->handle.id == id && active_->handle.stdout_fd >= 0) {
        ssize_t n = ::read(active_->handle.stdout_fd, buf, sizeof(buf));
        if (n > 0) {
            active_->channel.feed(std::string_view(buf, static_cast<size_t>(n)));
            continue;
        }

        if (n == 0) {
            active_->channel.finish();
            if (active_ && active_->handle.id == id) {
                if (auto dropped = active_->channel.dropped_lines(); dropped > 0) {
                    log(std::format("dropped {} undecodable line(s)", dropped));
                }
                close_stdout();
            }
            return;
        }

        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;

        std::string what = std::strerror(errno);
        std::println(stderr, "session: read from recognizer failed: {}", what);
        close_stdout();

        // The session cannot deliver text any more; report it and end the process.
        supervisor_.report_stream_error(id, what, active_->handle.last_error);
        if (active_ && active_->handle.id == id && !active_->handle.stop_requested) {
            active_->handle.stop_requested = true;
            ::kill(active_->handle.pid, SIGTERM);
        }
        return;
    }
}

void TranscriptSession::on_stderr_readable(uint64_t id) {
    char buf[4096];

    while (active_ && active_->handle.id == id && active_->handle.stderr_fd >= 0) {
        ssize_t n = ::read(active_->handle.stderr_fd, buf, sizeof(buf));
        if (n > 0) {
            active_->stderr_lines.append(std::string_view(buf, static_cast<size_t>(n)));
            while (auto line = active_->stderr_lines.next_line()) {
                note_stderr_line(*line);
            }
            continue;
        }

        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;

        // EOF or error: stderr is diagnostics only, nothing to escalate.
        note_stderr_line(active_->stderr_lines.take_remainder());
        close_stderr();
        return;
    }
}

void TranscriptSession::note_stderr_line(const std::string& line) {
    auto trimmed = text::trim(line);
    if (trimmed.empty() || !active_) return;
    active_->handle.last_error = trimmed;
    log("recognizer: " + trimmed);
}

void TranscriptSession::reap() {
    std::erase_if(retired_, [](pid_t pid) {
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);
        return r != 0; // reaped, or not our child any more
    });

    if (!active_) return;

    uint64_t id = active_->handle.id;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(active_->handle.pid, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return;

    std::string lost = r < 0 ? std::strerror(errno) : std::string();

    // Whatever the helper flushed before exiting is still in the pipes.
    on_stdout_readable(id);
    on_stderr_readable(id);
    if (!active_ || active_->handle.id != id) return;

    std::string last_error = active_->handle.last_error;
    close_stdout();
    close_stderr();
    active_.reset();

    if (r < 0) {
        std::println(stderr, "session: waitpid failed: {}", lost);
        supervisor_.report_stream_error(id, "lost track of recognizer process: " + lost, last_error);
        return;
    }

    auto exit_status = ExitStatus::from_wait_status(status);
    log("recognizer " + exit_status.describe());
    supervisor_.report_exit(id, exit_status, last_error);
}

void TranscriptSession::shutdown() {
    if (active_) {
        stop();
        retire_active();
    }

    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!retired_.empty() && std::chrono::steady_clock::now() < deadline) {
        reap();
        if (!retired_.empty()) std::this_thread::sleep_for(20ms);
    }

    for (pid_t pid : retired_) {
        ::kill(pid, SIGKILL);
        (void)wait_process(pid);
    }
    retired_.clear();
}

void TranscriptSession::retire_active() {
    close_stdout();
    close_stderr();
    retired_.push_back(active_->handle.pid);
    active_.reset();
}

void TranscriptSession::close_stdout() {
    auto& fd = active_->handle.stdout_fd;
    if (fd < 0) return;
    watcher_.unwatch(fd);
    ::close(fd);
    fd = -1;
}

void TranscriptSession::close_stderr() {
    auto& fd = active_->handle.stderr_fd;
    if (fd < 0) return;
    watcher_.unwatch(fd);
    ::close(fd);
    fd = -1;
}

void TranscriptSession::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[glu-code] {}", msg);
    }
}
