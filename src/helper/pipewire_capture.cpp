#include "pipewire_capture.hpp"

#include <cerrno>
#include <print>
#include <spa/utils/result.h>
#include <unistd.h>

PipeWireCapture::PipeWireCapture(SampleRing& ring, int notify_fd, uint32_t sample_rate,
                                 std::string target)
    : ring_(ring), notify_fd_(notify_fd), sample_rate_(sample_rate), target_(std::move(target)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::expected<void, std::string> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    loop_ = pw_thread_loop_new("glu-stt-helper", nullptr);
    if (!loop_) return std::unexpected("failed to create PipeWire thread loop");

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "glu-stt-helper",
        PW_KEY_APP_NAME, "glu-code",
        nullptr
    );
    if (!target_.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target_.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "glu-stt-capture",
        props,
        &stream_events_,
        this
    );
    if (!stream_) {
        teardown();
        return std::unexpected("failed to create PipeWire stream");
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );
    if (ret < 0) {
        teardown();
        return std::unexpected(std::string("stream connect failed: ") + spa_strerror(ret));
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        teardown();
        return std::unexpected(std::string("thread loop start failed: ") + spa_strerror(ret));
    }

    capturing_.store(true, std::memory_order_release);
    return {};
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    if (loop_) pw_thread_loop_stop(loop_);
    teardown();
}

std::optional<std::string> PipeWireCapture::take_error() {
    std::lock_guard lock(error_mutex_);
    auto err = std::move(error_);
    error_.reset();
    return err;
}

void PipeWireCapture::teardown() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::notify() {
    uint64_t one = 1;
    while (::write(notify_fd_, &one, sizeof(one)) < 0 && errno == EINTR) {}
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && self->capturing_.load(std::memory_order_relaxed)) {
        auto* bytes = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
        size_t count = d->chunk->size / sizeof(int16_t);
        if (count > 0) {
            self->ring_.write(reinterpret_cast<const int16_t*>(bytes), count);
            self->notify();
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!error && state != PW_STREAM_STATE_ERROR) return;

    std::println(stderr, "audio: stream state {} -> {}: {}",
                 pw_stream_state_as_string(old),
                 pw_stream_state_as_string(state),
                 error ? error : "unknown");
    if (state != PW_STREAM_STATE_ERROR) return;

    {
        std::lock_guard lock(self->error_mutex_);
        self->error_ = std::string("audio stream failed: ") + (error ? error : "unknown");
    }
    self->notify();
}
