#include <catch2/catch.hpp>

#include "event_channel.hpp"

#include <string>
#include <vector>

TEST_CASE("decode_event_line", "[event]") {

    SECTION("Partial") {
        auto e = decode_event_line(R"({"type":"partial","text":"hello wor"})");
        REQUIRE(e.has_value());
        REQUIRE(e->type == TranscriptEventType::Partial);
        REQUIRE(e->text == "hello wor");
    }

    SECTION("FinalIsTrimmed") {
        auto e = decode_event_line(R"(  {"type":"final","text":"  hello world \n"}  )");
        REQUIRE(e.has_value());
        REQUIRE(e->type == TranscriptEventType::Final);
        REQUIRE(e->text == "hello world");
    }

    SECTION("Error") {
        auto e = decode_event_line(R"({"type":"error","error":"mic unavailable"})");
        REQUIRE(e == TranscriptEvent{TranscriptEventType::Error, "mic unavailable"});
    }

    SECTION("ExtraFieldsIgnored") {
        auto e = decode_event_line(R"({"type":"final","text":"ok","conf":0.9})");
        REQUIRE(e == TranscriptEvent{TranscriptEventType::Final, "ok"});
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(decode_event_line(""));
        REQUIRE_FALSE(decode_event_line("   "));
        REQUIRE_FALSE(decode_event_line("LOG (VoskAPI:ReadDataFiles) loading model"));
        REQUIRE_FALSE(decode_event_line("{not json"));
        REQUIRE_FALSE(decode_event_line(R"(["type","final"])"));
        REQUIRE_FALSE(decode_event_line(R"({"text":"no type"})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":5,"text":"x"})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"unknown","text":"x"})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"final","text":""})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"final","text":"   "})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"partial"})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"final","text":42})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"error","text":"wrong key"})"));
        REQUIRE_FALSE(decode_event_line(R"({"type":"error","error":""})"));
    }
}

TEST_CASE("encode_event_line", "[event]") {
    SECTION("Shapes") {
        REQUIRE(encode_event_line({TranscriptEventType::Partial, "hel"}) ==
                R"({"text":"hel","type":"partial"})");
        REQUIRE(encode_event_line({TranscriptEventType::Final, R"(say "hi")"}) ==
                R"({"text":"say \"hi\"","type":"final"})");
        REQUIRE(encode_event_line({TranscriptEventType::Error, "mic unavailable"}) ==
                R"({"error":"mic unavailable","type":"error"})");
    }

    SECTION("ReadableByDecoder") {
        TranscriptEvent e{TranscriptEventType::Final, "line\none"};
        REQUIRE(decode_event_line(encode_event_line(e)) == e);
    }
}

TEST_CASE("LineBuffer", "[event]") {

    SECTION("SplitsLines") {
        LineBuffer buf;
        buf.append("one\ntwo\nthr");
        REQUIRE(buf.next_line() == "one");
        REQUIRE(buf.next_line() == "two");
        REQUIRE_FALSE(buf.next_line());
        buf.append("ee\n");
        REQUIRE(buf.next_line() == "three");
        REQUIRE(buf.empty());
    }

    SECTION("StripsCarriageReturn") {
        LineBuffer buf;
        buf.append("a\r\nb\r");
        REQUIRE(buf.next_line() == "a");
        REQUIRE(buf.take_remainder() == "b");
    }

    SECTION("OversizedLineDiscarded") {
        LineBuffer buf(8);
        buf.append("0123456789");
        REQUIRE(buf.overflowed() == 1);
        REQUIRE(buf.empty());
        buf.append("abc");          // still inside the long line
        buf.append("def\nnext\n");
        REQUIRE(buf.next_line() == "next");
        REQUIRE_FALSE(buf.next_line());
    }
}

TEST_CASE("EventChannel", "[event]") {
    std::vector<TranscriptEvent> events;
    EventChannel channel([&](const TranscriptEvent& e) { events.push_back(e); });

    SECTION("EventsSplitAcrossChunks") {
        REQUIRE(channel.feed(R"({"type":"par)") == 0);
        REQUIRE(channel.feed(R"(tial","text":"he"})" "\n" R"({"type":"final",)") == 1);
        REQUIRE(channel.feed(R"("text":"hello"})" "\n") == 1);

        REQUIRE(events.size() == 2);
        REQUIRE(events[0] == TranscriptEvent{TranscriptEventType::Partial, "he"});
        REQUIRE(events[1] == TranscriptEvent{TranscriptEventType::Final, "hello"});
    }

    SECTION("NoiseSkippedInOrder") {
        channel.feed("LOG loading model\n"
                     R"({"type":"final","text":"a"})" "\n"
                     "garbage\n"
                     "\n"
                     R"({"type":"final","text":"b"})" "\n");
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].text == "a");
        REQUIRE(events[1].text == "b");
        REQUIRE(channel.dropped_lines() == 2);
    }

    SECTION("FinishDecodesTrailingLine") {
        channel.feed(R"({"type":"final","text":"last words"})");
        REQUIRE(events.empty());
        REQUIRE(channel.finish() == 1);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].text == "last words");
        REQUIRE(channel.finish() == 0);
    }
}
