#include <catch2/catch.hpp>

#include "sample_ring.hpp"
#include "transcriber.hpp"

#include <cstdint>
#include <deque>
#include <numeric>
#include <string>
#include <vector>

namespace {

// Each accept() consumes the next scripted step.
class ScriptedRecognizer : public SpeechRecognizer {
public:
    struct Step {
        bool ended = false;
        std::string result;   // result() when ended, partial_result() otherwise
        std::string error;    // accept() fails when set
    };

    std::expected<bool, std::string> accept(std::span<const int16_t> samples) override {
        accepted += samples.size();
        if (steps.empty()) return false;
        current = steps.front();
        steps.pop_front();
        if (!current.error.empty()) return std::unexpected(current.error);
        return current.ended;
    }

    std::string result() override { return current.result; }
    std::string partial_result() override { return current.ended ? R"({"partial":""})" : current.result; }
    std::string final_result() override {
        ++final_calls;
        return final_text;
    }

    std::deque<Step> steps;
    Step current;
    std::string final_text = R"({"text":""})";
    size_t accepted = 0;
    int final_calls = 0;
};

} // namespace

TEST_CASE("Transcriber", "[helper]") {
    ScriptedRecognizer rec;
    std::vector<TranscriptEvent> events;
    Transcriber transcriber(rec, [&](const TranscriptEvent& e) { events.push_back(e); });
    std::vector<int16_t> chunk(160, 0);

    using E = TranscriptEventType;

    SECTION("PartialsThenFinal") {
        rec.steps = {
            {.result = R"({"partial":"hel"})"},
            {.result = R"({"partial":"hel"})"},
            {.result = R"({"partial":"hello wor"})"},
            {.ended = true, .result = R"({"text":" hello world "})"},
        };
        for (int i = 0; i < 4; ++i) transcriber.feed(chunk);

        REQUIRE(rec.accepted == 4 * chunk.size());
        // The repeated hypothesis is not re-sent.
        REQUIRE(events == std::vector<TranscriptEvent>{
            {E::Partial, "hel"},
            {E::Partial, "hello wor"},
            {E::Final, "hello world"},
        });
    }

    SECTION("EmptyResultsSkipped") {
        rec.steps = {
            {.result = R"({"partial":"  "})"},
            {.ended = true, .result = R"({"text":""})"},
            {.result = "not json"},
        };
        for (int i = 0; i < 3; ++i) transcriber.feed(chunk);
        REQUIRE(events.empty());
    }

    SECTION("PartialRepeatsAfterUtterance") {
        rec.steps = {
            {.result = R"({"partial":"yes"})"},
            {.ended = true, .result = R"({"text":"yes"})"},
            {.result = R"({"partial":"yes"})"},
        };
        for (int i = 0; i < 3; ++i) transcriber.feed(chunk);
        REQUIRE(events.size() == 3);
        REQUIRE(events[2] == TranscriptEvent{E::Partial, "yes"});
    }

    SECTION("AcceptFailureIsErrorEvent") {
        rec.steps = {{.error = "recognizer rejected audio"}};
        transcriber.feed(chunk);
        REQUIRE(events == std::vector<TranscriptEvent>{{E::Error, "recognizer rejected audio"}});
    }

    SECTION("FinishFlushesOnce") {
        rec.final_text = R"({"text":"last words"})";
        transcriber.finish();
        transcriber.finish();
        REQUIRE(rec.final_calls == 1);
        REQUIRE(events == std::vector<TranscriptEvent>{{E::Final, "last words"}});

        // Audio after the flush is ignored.
        transcriber.feed(chunk);
        REQUIRE(rec.accepted == 0);
    }

    SECTION("EmptyChunkIgnored") {
        transcriber.feed({});
        REQUIRE(rec.accepted == 0);
    }

    SECTION("ResultText") {
        REQUIRE(Transcriber::result_text(R"({"text":" a b "})", "text") == "a b");
        REQUIRE(Transcriber::result_text(R"({"partial":"x"})", "text") == std::nullopt);
        REQUIRE(Transcriber::result_text(R"({"text":3})", "text") == std::nullopt);
        REQUIRE(Transcriber::result_text("", "text") == std::nullopt);
    }
}

TEST_CASE("SampleRing", "[helper]") {
    SampleRing ring(8);
    std::vector<int16_t> out;

    SECTION("WriteAndDrain") {
        std::vector<int16_t> samples = {100, -200, 300};
        REQUIRE(ring.write(samples.data(), samples.size()) == 3);
        REQUIRE(ring.drain(out) == 3);
        REQUIRE(out == samples);
        REQUIRE(ring.drain(out) == 0);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> first(6);
        std::iota(first.begin(), first.end(), int16_t(1));
        ring.write(first.data(), first.size());
        ring.drain(out);

        std::vector<int16_t> second(5);
        std::iota(second.begin(), second.end(), int16_t(40));
        REQUIRE(ring.write(second.data(), second.size()) == 5);

        out.clear();
        REQUIRE(ring.drain(out) == 5);
        REQUIRE(out == second);
    }

    SECTION("OverflowCountsDropped") {
        std::vector<int16_t> big(11, 7);
        REQUIRE(ring.write(big.data(), big.size()) == 8);
        REQUIRE(ring.dropped() == 3);
        REQUIRE(ring.drain(out) == 8);
    }
}
