#include "config.hpp"
#include "event_channel.hpp"
#include "pipewire_capture.hpp"
#include "platform/linux/event_loop.hpp"
#include "sample_ring.hpp"
#include "text_util.hpp"
#include "transcriber.hpp"
#include "vosk_recognizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

// stdout carries one JSON event per line and nothing else.
static void emit(const TranscriptEvent& event) {
    if (event.type == TranscriptEventType::Error) {
        std::println(stderr, "stt-helper: {}", event.text);
    }
    std::println(stdout, "{}", encode_event_line(event));
    std::fflush(stdout);
}

static void emit_error(const std::string& message) {
    emit(TranscriptEvent{TranscriptEventType::Error, message});
}

int main(int argc, char* argv[]) {
    // VOSK_MODEL_PATH and STT_DEVICE apply when no argument overrides them.
    Config config;
    config.apply_environment();

    std::string model_path;
    std::string device = config.recognizer.device;
    uint32_t sample_rate = config.recognizer.sample_rate;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--model" && i + 1 < argc) {
            model_path = argv[++i];
        } else if (arg == "--sample-rate" && i + 1 < argc) {
            auto rate = text::parse_positive_int(argv[++i]);
            if (!rate) {
                std::println(stderr, "Invalid --sample-rate: {}", argv[i]);
                return 2;
            }
            sample_rate = static_cast<uint32_t>(*rate);
        } else if (arg == "--device" && i + 1 < argc) {
            device = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: glu-stt-helper [--model DIR] [--sample-rate N] [--device NODE]");
            std::println("Captures the microphone and prints transcript events as JSON lines.");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 2;
        }
    }
    if (model_path.empty()) model_path = config.model_path();

    std::error_code ec;
    if (!fs::exists(model_path, ec)) {
        emit_error("Model path not found: " + model_path);
        return 1;
    }

    vosk_set_log_level(verbose ? 0 : -1);
    auto recognizer = VoskSpeechRecognizer::create(model_path, static_cast<float>(sample_rate));
    if (!recognizer) {
        emit_error(recognizer.error());
        return 1;
    }
    Transcriber transcriber(**recognizer, emit);

    EventLoop loop;
    if (!loop.init({SIGINT, SIGTERM})) return 1;

    int notify_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (notify_fd < 0) {
        emit_error(std::string("eventfd failed: ") + std::strerror(errno));
        return 1;
    }

    // Ten seconds of audio absorbs any stall in recognition.
    SampleRing ring(static_cast<size_t>(sample_rate) * 10);
    PipeWireCapture capture(ring, notify_fd, sample_rate, device);

    std::vector<int16_t> samples;
    auto drain = [&] {
        samples.clear();
        if (ring.drain(samples) > 0) transcriber.feed(samples);
    };

    int exit_code = 0;
    bool watching = loop.watch(notify_fd, [&] {
        uint64_t count;
        while (::read(notify_fd, &count, sizeof(count)) > 0) {}

        if (auto err = capture.take_error()) {
            emit_error(*err);
            exit_code = 1;
            loop.request_stop();
            return;
        }
        drain();
    });
    if (!watching) {
        ::close(notify_fd);
        return 1;
    }

    // Stopping is the normal way out: flush the last utterance, exit 0.
    for (int signo : {SIGINT, SIGTERM}) {
        loop.on_signal(signo, [&, signo] {
            if (verbose) std::println(stderr, "stt-helper: {} received, flushing", ::strsignal(signo));
            loop.request_stop();
        });
    }

    if (auto started = capture.start(); !started) {
        emit_error("failed to start recorder: " + started.error());
        loop.unwatch(notify_fd);
        ::close(notify_fd);
        return 1;
    }
    if (verbose) {
        std::println(stderr, "stt-helper: capturing at {} Hz from {}", sample_rate,
                     device.empty() ? "default source" : device);
    }

    loop.run();

    capture.stop();
    drain();
    transcriber.finish();

    if (ring.dropped() > 0) {
        std::println(stderr, "stt-helper: dropped {} samples", ring.dropped());
    }

    loop.unwatch(notify_fd);
    ::close(notify_fd);
    return exit_code;
}
