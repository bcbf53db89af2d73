#include <catch2/catch.hpp>
#include "sse.hpp"
#include <vector>

using namespace streamgate;

// Helper: collect all events from a single feed
static std::vector<SSEEvent> collect_events(SSEParser& parser, const std::string& chunk) {
    std::vector<SSEEvent> events;
    parser.feed(chunk, [&](const SSEEvent& ev) {
        events.push_back(ev);
        return true;
    });
    return events;
}

// ── Basic event parsing ──────────────────────────────────────────

TEST_CASE("SSEParser: single data-only event", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: event with named type", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "event: chunk\ndata: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "chunk");
    REQUIRE(events[0].data == "{}");
}

TEST_CASE("SSEParser: multiple events in one chunk", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: first\n\ndata: second\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "first");
    REQUIRE(events[1].data == "second");
}

TEST_CASE("SSEParser: multi-line data concatenated", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: line1\ndata: line2\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "line1\nline2");
}

TEST_CASE("SSEParser: data field without space after colon", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data:no_space\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "no_space");
}

// ── Streaming / chunked delivery ─────────────────────────────────

TEST_CASE("SSEParser: event split across two chunks", "[sse]") {
    SSEParser parser;

    auto events1 = collect_events(parser, "data: hel");
    REQUIRE(events1.empty());

    auto events2 = collect_events(parser, "lo\n\n");
    REQUIRE(events2.size() == 1);
    REQUIRE(events2[0].data == "hello");
}

TEST_CASE("SSEParser: blank line arrives in a later chunk", "[sse]") {
    SSEParser parser;

    auto events1 = collect_events(parser, "event: chunk\ndata: {\"type\":\"start\"}\n");
    REQUIRE(events1.empty());

    auto events2 = collect_events(parser, "\n");
    REQUIRE(events2.size() == 1);
    REQUIRE(events2[0].event == "chunk");
    REQUIRE(events2[0].data == "{\"type\":\"start\"}");
}

TEST_CASE("SSEParser: one byte at a time", "[sse]") {
    SSEParser parser;
    std::string stream = "data: a\n\ndata: [DONE]\n\n";
    std::vector<SSEEvent> events;
    for (char c : stream) {
        auto got = collect_events(parser, std::string(1, c));
        events.insert(events.end(), got.begin(), got.end());
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "a");
    REQUIRE(events[1].data == "[DONE]");
}

TEST_CASE("SSEParser: empty lines between events", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: a\n\n\n\ndata: b\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "a");
    REQUIRE(events[1].data == "b");
}

// ── Carriage return handling ─────────────────────────────────────

TEST_CASE("SSEParser: handles \\r\\n line endings", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\r\n\r\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

// ── Callback stopping ────────────────────────────────────────────

TEST_CASE("SSEParser: callback returning false stops parsing", "[sse]") {
    SSEParser parser;
    std::vector<SSEEvent> events;
    parser.feed("data: first\n\ndata: second\n\n", [&](const SSEEvent& ev) {
        events.push_back(ev);
        return false;
    });
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "first");

    // The unread frame stays buffered for the next feed
    auto rest = collect_events(parser, "");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].data == "second");
}

// ── flush / reset ────────────────────────────────────────────────

TEST_CASE("SSEParser: flush dispatches an unterminated frame", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: tail");
    REQUIRE(events.empty());

    std::vector<SSEEvent> flushed;
    parser.flush([&](const SSEEvent& ev) {
        flushed.push_back(ev);
        return true;
    });
    REQUIRE(flushed.size() == 1);
    REQUIRE(flushed[0].data == "tail");
}

TEST_CASE("SSEParser: reset clears buffer state", "[sse]") {
    SSEParser parser;
    collect_events(parser, "data: partial");
    parser.reset();

    auto events = collect_events(parser, "data: fresh\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "fresh");
}

// ── No events ────────────────────────────────────────────────────

TEST_CASE("SSEParser: empty input produces no events", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "");
    REQUIRE(events.empty());
}

TEST_CASE("SSEParser: comment lines ignored", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, ": keepalive\ndata: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}
