#pragma once

#include "audio_capture.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

// Mono S16 capture from the default PipeWire source, or from `target` (a node
// name or serial) when set. Every delivered buffer is pushed into the ring
// and announced on `notify_fd` (an eventfd).
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(SampleRing& ring, int notify_fd, uint32_t sample_rate = 16000,
                    std::string target = {});
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, std::string> start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    // The stream failure reported by PipeWire, once.
    std::optional<std::string> take_error();

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);
    void notify();
    void teardown();

    SampleRing& ring_;
    int notify_fd_;
    uint32_t sample_rate_;
    std::string target_;
    std::atomic<bool> capturing_{false};

    std::mutex error_mutex_;
    std::optional<std::string> error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
