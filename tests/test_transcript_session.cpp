#include <catch2/catch.hpp>

#include "platform/linux/event_loop.hpp"
#include "test_support.hpp"
#include "transcript_session.hpp"

#include <chrono>
#include <csignal>
#include <memory>
#include <signal.h>
#include <string>
#include <vector>

namespace {

template <typename Pred>
bool pump(EventLoop& loop, Pred done, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        loop.run_once(50);
    }
    return true;
}

} // namespace

TEST_CASE("TranscriptSession", "[session]") {
    TmpDir tmp;
    auto model = tmp.make_dir("model");

    EventLoop loop;
    REQUIRE(loop.init({SIGCHLD}));

    std::vector<TranscriptEvent> events;
    std::vector<std::string> faults;

    auto make_session = [&](const std::string& body) {
        auto script = write_script(tmp.file("helper.sh"), body);
        auto session = std::make_unique<TranscriptSession>(loop, script);
        session->set_event_handler([&](const TranscriptEvent& e) { events.push_back(e); });
        session->set_fault_handler([&](const std::string& d) { faults.push_back(d); });
        loop.on_signal(SIGCHLD, [s = session.get()] { s->reap(); });
        return session;
    };

    RecognizerOptions opts{.model_path = model, .sample_rate = 16000};

    SECTION("BuildCommand") {
        TranscriptSession session(loop, "glu-stt-helper", {"--quiet"});
        auto argv = session.build_command(RecognizerOptions{
            .model_path = "/m", .sample_rate = 8000, .device = "hw:1"});
        REQUIRE(argv == std::vector<std::string>{
            "glu-stt-helper", "--quiet", "--model", "/m", "--sample-rate", "8000",
            "--device", "hw:1"});

        auto plain = session.build_command(RecognizerOptions{.model_path = "/m"});
        REQUIRE(plain == std::vector<std::string>{
            "glu-stt-helper", "--quiet", "--model", "/m", "--sample-rate", "16000"});
    }

    SECTION("MissingModelRefused") {
        auto session = make_session("exit 0\n");
        auto res = session->start(RecognizerOptions{.model_path = tmp.file("absent")});
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "model path not found: " + tmp.file("absent"));
        REQUIRE(session->handle() == nullptr);
        REQUIRE_FALSE(session->is_active());
    }

    SECTION("SpawnFailureReported") {
        TranscriptSession session(loop, tmp.file("no-such-helper"));
        auto res = session.start(opts);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().starts_with("failed to start recognizer: "));
        REQUIRE(session.handle() == nullptr);
    }

    SECTION("EventsDeliveredInOrder") {
        auto session = make_session(
            "echo 'LOG (VoskAPI) loading model' >&2\n"
            "echo 'not an event'\n"
            "printf '%s\\n' '{\"type\":\"partial\",\"text\":\"hel\"}'\n"
            "printf '%s\\n' '{\"type\":\"final\",\"text\":\"hello\"}'\n"
            "printf '{\"type\":\"final\",\"text\":\"%s\"}\\n' \"$*\"\n"
            "exec sleep 5\n");
        REQUIRE(session->start(opts));
        REQUIRE(session->is_active());
        REQUIRE(session->handle()->pid > 0);

        REQUIRE(pump(loop, [&] { return events.size() >= 3; }));
        REQUIRE(events[0] == TranscriptEvent{TranscriptEventType::Partial, "hel"});
        REQUIRE(events[1] == TranscriptEvent{TranscriptEventType::Final, "hello"});
        REQUIRE(events[2].text == "--model " + model + " --sample-rate 16000");

        session->stop();
        REQUIRE_FALSE(session->is_active());
        REQUIRE(session->handle()->stop_requested);
        REQUIRE(pump(loop, [&] { return session->handle() == nullptr; }));
        REQUIRE(faults.empty());
    }

    SECTION("UnrequestedExitReportedWithStderr") {
        auto session = make_session(
            "echo 'audio device busy' >&2\n"
            "exit 3\n");
        REQUIRE(session->start(opts));
        REQUIRE(pump(loop, [&] { return !faults.empty(); }));
        REQUIRE(faults == std::vector<std::string>{"recognizer exited with code 3: audio device busy"});
        REQUIRE(session->handle() == nullptr);
    }

    SECTION("OutputFlushedBeforeExitIsDelivered") {
        auto session = make_session(
            "printf '%s' '{\"type\":\"final\",\"text\":\"last words\"}'\n"
            "exit 0\n");
        REQUIRE(session->start(opts));
        REQUIRE(pump(loop, [&] { return !faults.empty(); }));
        REQUIRE(events == std::vector<TranscriptEvent>{{TranscriptEventType::Final, "last words"}});
        REQUIRE(faults == std::vector<std::string>{"recognizer exited with code 0"});
    }

    SECTION("ErrorEventBecomesDiagnostic") {
        auto session = make_session(
            "printf '%s\\n' '{\"type\":\"error\",\"error\":\"model failed to load\"}'\n"
            "exit 1\n");
        REQUIRE(session->start(opts));
        REQUIRE(pump(loop, [&] { return !faults.empty(); }));
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == TranscriptEventType::Error);
        REQUIRE(faults[0] == "recognizer exited with code 1: model failed to load");
    }

    SECTION("RestartRetiresDrainingSession") {
        auto session = make_session(
            "trap 'sleep 0.3; exit 0' TERM\n"
            "printf '%s\\n' '{\"type\":\"final\",\"text\":\"take\"}'\n"
            "while true; do sleep 0.05; done\n");
        REQUIRE(session->start(opts));
        auto first_id = session->handle()->id;
        REQUIRE(pump(loop, [&] { return events.size() == 1; }));

        session->stop();
        REQUIRE(session->start(opts));
        REQUIRE(session->retired_count() == 1);
        REQUIRE(session->handle()->id != first_id);
        REQUIRE(session->is_active());

        REQUIRE(pump(loop, [&] { return events.size() == 2 && session->retired_count() == 0; }));
        REQUIRE(faults.empty());

        session->shutdown();
        REQUIRE(session->handle() == nullptr);
        REQUIRE(session->retired_count() == 0);
        REQUIRE(faults.empty());
    }

    SECTION("StopIsIdempotent") {
        auto idle = make_session("exit 0\n");
        idle->stop();
        REQUIRE(idle->handle() == nullptr);
        REQUIRE_FALSE(idle->is_active());

        auto terms = tmp.file("terms.log");
        auto session = make_session(
            "trap 'echo term >> " + terms + "; exit 0' TERM\n"
            "printf '%s\\n' '{\"type\":\"partial\",\"text\":\"ready\"}'\n"
            "while true; do sleep 0.05; done\n");
        REQUIRE(session->start(opts));
        REQUIRE(pump(loop, [&] { return events.size() == 1; }));

        session->stop();
        session->stop();
        REQUIRE(pump(loop, [&] { return session->handle() == nullptr; }));
        REQUIRE(read_file(terms) == "term\n");
        REQUIRE(faults.empty());

        session->stop();
        REQUIRE(faults.empty());
    }

    SECTION("KilledBySignalReported") {
        auto session = make_session(
            "printf '%s\\n' '{\"type\":\"partial\",\"text\":\"ready\"}'\n"
            "exec sleep 5\n");
        REQUIRE(session->start(opts));
        REQUIRE(pump(loop, [&] { return events.size() == 1; }));

        REQUIRE(::kill(session->handle()->pid, SIGKILL) == 0);
        REQUIRE(pump(loop, [&] { return !faults.empty(); }));
        REQUIRE(faults.size() == 1);
        REQUIRE(faults[0].starts_with("recognizer killed by signal 9"));
        REQUIRE(session->handle() == nullptr);
        REQUIRE_FALSE(session->is_active());

        // Nothing further once the exit has been reported.
        pump(loop, [] { return false; }, 200);
        REQUIRE(faults.size() == 1);
    }

    SECTION("StartWhileActiveRefused") {
        auto session = make_session("exec sleep 5\n");
        REQUIRE(session->start(opts));
        auto again = session->start(opts);
        REQUIRE_FALSE(again);
        REQUIRE(session->retired_count() == 0);
        session->shutdown();
        REQUIRE(faults.empty());
    }
}
