#pragma once

#include "transcript_event.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

struct RecognizerOptions {
    std::string model_path;
    uint32_t sample_rate = 16000;
    std::string device; // empty: helper's default capture device
};

// A source of transcript events backed by some recognition engine.
// TranscriptSession is the subprocess implementation; tests substitute mocks.
class Recognizer {
public:
    using EventHandler = std::function<void(const TranscriptEvent&)>;
    // Invoked at most once per session when it dies without having been asked to.
    using FaultHandler = std::function<void(const std::string& diagnostic)>;

    virtual ~Recognizer() = default;

    virtual void set_event_handler(EventHandler handler) = 0;
    virtual void set_fault_handler(FaultHandler handler) = 0;

    virtual std::expected<void, std::string> start(const RecognizerOptions& options) = 0;
    virtual void stop() = 0;
    virtual bool is_active() const = 0;
};
