#pragma once

#include "event_channel.hpp"
#include "platform/fd_watcher.hpp"
#include "recognizer.hpp"
#include "session_supervisor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

// The external recognizer process for one session.
struct SessionHandle {
    uint64_t id = 0;
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    std::string last_error; // last error event or stderr line, for exit diagnostics
    bool stop_requested = false;
};

// Runs the recognizer helper as a subprocess and turns its stdout into
// TranscriptEvents:
//
//   <program> <args...> --model DIR --sample-rate N [--device ID]
//
// Pipes are serviced through the FdWatcher; the owner must call reap() on
// SIGCHLD so exits are observed.
class TranscriptSession : public Recognizer {
public:
    TranscriptSession(FdWatcher& watcher, std::string program,
                      std::vector<std::string> args = {}, bool verbose = false);
    ~TranscriptSession() override;

    TranscriptSession(const TranscriptSession&) = delete;
    TranscriptSession& operator=(const TranscriptSession&) = delete;

    void set_event_handler(EventHandler handler) override { on_event_ = std::move(handler); }
    void set_fault_handler(FaultHandler handler) override;

    std::expected<void, std::string> start(const RecognizerOptions& options) override;
    void stop() override;
    bool is_active() const override { return active_ && !active_->handle.stop_requested; }

    // Collect exited children; reports the active session's exit.
    void reap();

    // Terminate and reap everything now (blocking, bounded).
    void shutdown();

    // Classification and forwarding of one decoded event.
    void feed_result(const TranscriptEvent& event);

    const SessionHandle* handle() const { return active_ ? &active_->handle : nullptr; }
    size_t retired_count() const { return retired_.size(); }

    std::vector<std::string> build_command(const RecognizerOptions& options) const;

private:
    struct ActiveSession {
        SessionHandle handle;
        EventChannel channel;
        LineBuffer stderr_lines;

        ActiveSession(SessionHandle h, EventChannel::EventCallback cb)
            : handle(std::move(h)), channel(std::move(cb)) {}
    };

    void on_stdout_readable(uint64_t id);
    void on_stderr_readable(uint64_t id);
    void drain_stdout();
    void close_stdout();
    void close_stderr();
    void note_stderr_line(const std::string& line);
    void retire_active();
    void log(const std::string& msg);

    FdWatcher& watcher_;
    std::string program_;
    std::vector<std::string> args_;
    bool verbose_;

    EventHandler on_event_;
    SessionSupervisor supervisor_;
    std::unique_ptr<ActiveSession> active_;
    std::vector<pid_t> retired_; // stopped sessions whose exit is still pending
    uint64_t next_id_ = 1;
};
