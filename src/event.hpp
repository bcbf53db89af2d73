#pragma once
#include <string>
#include <cstdint>

namespace streamgate {

// Tag-based event dispatch, no RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionCreated    = "SessionCreated";
    constexpr const char* HistoryReplayed   = "HistoryReplayed";
    constexpr const char* ApprovalRequested = "ApprovalRequested";
    constexpr const char* ApprovalResolved  = "ApprovalResolved";
    constexpr const char* ApprovalTimedOut  = "ApprovalTimedOut";
    constexpr const char* TurnStarted       = "TurnStarted";
    constexpr const char* TurnFinished      = "TurnFinished";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;
    std::string subject;
    bool fetched_existing = false; // backend already had it

    SessionCreatedEvent() { type_tag = TAG; }
};

struct HistoryReplayedEvent : Event {
    static constexpr const char* TAG = event_tags::HistoryReplayed;
    std::string session_id;
    size_t replayed = 0;
    size_t replayed_total = 0;

    HistoryReplayedEvent() { type_tag = TAG; }
};

struct ApprovalRequestedEvent : Event {
    static constexpr const char* TAG = event_tags::ApprovalRequested;
    std::string request_id;
    std::string name;

    ApprovalRequestedEvent() { type_tag = TAG; }
};

struct ApprovalResolvedEvent : Event {
    static constexpr const char* TAG = event_tags::ApprovalResolved;
    std::string request_id;
    bool approved = false;
    std::string reason;

    ApprovalResolvedEvent() { type_tag = TAG; }
};

struct ApprovalTimedOutEvent : Event {
    static constexpr const char* TAG = event_tags::ApprovalTimedOut;
    std::string request_id;
    uint64_t waited_ms = 0;

    ApprovalTimedOutEvent() { type_tag = TAG; }
};

struct TurnStartedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnStarted;
    std::string message_id;

    TurnStartedEvent() { type_tag = TAG; }
};

struct TurnFinishedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnFinished;
    std::string message_id;
    bool errored = false;
    size_t chunk_count = 0;

    TurnFinishedEvent() { type_tag = TAG; }
};

} // namespace streamgate
