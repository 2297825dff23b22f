#pragma once

#include "platform/linux/process.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Decides whether the end of a recognizer session is news. A stop the user
// asked for completes silently; anything else is reported once through the
// handler together with a diagnostic for the status line.
class SessionSupervisor {
public:
    using AbnormalHandler = std::function<void(const std::string& diagnostic)>;

    void set_handler(AbnormalHandler handler) { handler_ = std::move(handler); }

    void session_started(uint64_t session_id);
    void stop_requested(uint64_t session_id);

    // Returns true if the event was escalated to the handler.
    bool report_exit(uint64_t session_id, const ExitStatus& status,
                     const std::string& last_error);
    bool report_stream_error(uint64_t session_id, const std::string& what,
                             const std::string& last_error);

    bool expecting_exit(uint64_t session_id) const;

    static std::string format_diagnostic(const std::string& reason,
                                         const std::string& last_error);

private:
    bool escalate(uint64_t session_id, const std::string& reason,
                  const std::string& last_error);

    struct Tracked {
        uint64_t id = 0;
        bool stop_requested = false;
        bool reported = false;
    };

    std::optional<Tracked> current_;
    AbnormalHandler handler_;
};
