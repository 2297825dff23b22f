#include "session_supervisor.hpp"

void SessionSupervisor::session_started(uint64_t session_id) {
    current_ = Tracked{.id = session_id};
}

void SessionSupervisor::stop_requested(uint64_t session_id) {
    if (current_ && current_->id == session_id) {
        current_->stop_requested = true;
    }
}

bool SessionSupervisor::expecting_exit(uint64_t session_id) const {
    return current_ && current_->id == session_id && current_->stop_requested;
}

bool SessionSupervisor::report_exit(uint64_t session_id, const ExitStatus& status,
                                    const std::string& last_error) {
    return escalate(session_id, "recognizer " + status.describe(), last_error);
}

bool SessionSupervisor::report_stream_error(uint64_t session_id, const std::string& what,
                                            const std::string& last_error) {
    return escalate(session_id, "recognizer stream error: " + what, last_error);
}

bool SessionSupervisor::escalate(uint64_t session_id, const std::string& reason,
                                 const std::string& last_error) {
    if (!current_ || current_->id != session_id) return false;
    if (current_->stop_requested || current_->reported) return false;

    current_->reported = true;
    if (handler_) handler_(format_diagnostic(reason, last_error));
    return true;
}

std::string SessionSupervisor::format_diagnostic(const std::string& reason,
                                                 const std::string& last_error) {
    if (last_error.empty()) return reason;
    return reason + ": " + last_error;
}
