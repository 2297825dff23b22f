#pragma once

#include "recognizer.hpp"

#include <string>

// Records calls and lets a test push events or a fault as if they came from a
// live recognizer.
class MockRecognizer : public Recognizer {
public:
    void set_event_handler(EventHandler handler) override { on_event_ = std::move(handler); }
    void set_fault_handler(FaultHandler handler) override { on_fault_ = std::move(handler); }

    std::expected<void, std::string> start(const RecognizerOptions& options) override {
        ++starts;
        last_options = options;
        if (!fail_with.empty()) return std::unexpected(fail_with);
        active_ = true;
        return {};
    }

    void stop() override {
        ++stops;
        active_ = false;
    }

    bool is_active() const override { return active_; }

    void emit(TranscriptEventType type, const std::string& text) {
        if (on_event_) on_event_(TranscriptEvent{type, text});
    }

    void fault(const std::string& diagnostic) {
        active_ = false;
        if (on_fault_) on_fault_(diagnostic);
    }

    int starts = 0;
    int stops = 0;
    RecognizerOptions last_options;
    std::string fail_with;

private:
    EventHandler on_event_;
    FaultHandler on_fault_;
    bool active_ = false;
};
