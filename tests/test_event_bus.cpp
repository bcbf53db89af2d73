#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <stdexcept>
#include <vector>

using namespace streamgate;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) {
        count++;
    });

    SessionCreatedEvent ev;
    ev.session_id = "s1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    TurnStartedEvent ev;
    bus.publish(ev);

    REQUIRE(order.size() == 2);
    REQUIRE(order[0] == 1);
    REQUIRE(order[1] == 2);
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    ApprovalTimedOutEvent ev;
    bus.publish(ev); // should not crash
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int requested = 0;
    int resolved = 0;

    bus.subscribe(ApprovalRequestedEvent::TAG, [&](const Event&) { requested++; });
    bus.subscribe(ApprovalResolvedEvent::TAG, [&](const Event&) { resolved++; });

    ApprovalRequestedEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);

    ApprovalResolvedEvent ev2;
    bus.publish(ev2);

    REQUIRE(requested == 2);
    REQUIRE(resolved == 1);
}

// ── Catch-all ───────────────────────────────────────────────────

TEST_CASE("EventBus: subscribe_all sees every tag after tag handlers", "[event_bus]") {
    EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe_all([&](const Event& e) { seen.push_back(std::string("all:") + e.type_tag); });
    bus.subscribe(TurnFinishedEvent::TAG, [&](const Event&) { seen.push_back("tag"); });

    TurnFinishedEvent finished;
    HistoryReplayedEvent replayed;
    bus.publish(finished);
    bus.publish(replayed);

    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0] == "tag");
    REQUIRE(seen[1] == "all:TurnFinished");
    REQUIRE(seen[2] == "all:HistoryReplayed");
}

// ── Handler failures ────────────────────────────────────────────

TEST_CASE("EventBus: throwing handler does not stop later handlers", "[event_bus]") {
    EventBus bus;
    int later = 0;

    bus.subscribe(TurnStartedEvent::TAG, [](const Event&) {
        throw std::runtime_error("observer broke");
    });
    bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) { later++; });

    TurnStartedEvent ev;
    REQUIRE_NOTHROW(bus.publish(ev));
    REQUIRE(later == 1);
}

// ── Unsubscribe ─────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;

    uint64_t id = bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) {
        count++;
    });

    SessionCreatedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);

    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1); // not called again
}

TEST_CASE("EventBus: unsubscribe works for catch-all handlers", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = bus.subscribe_all([&](const Event&) { count++; });

    REQUIRE(bus.unsubscribe(id));
    TurnStartedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: unsubscribe returns false for unknown id", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.unsubscribe(999));
}

// ── Clear ───────────────────────────────────────────────────────

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe_all([&](const Event&) { count++; });

    bus.clear();

    SessionCreatedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

// ── subscriber_count ────────────────────────────────────────────

TEST_CASE("EventBus: subscriber_count", "[event_bus]") {
    EventBus bus;
    REQUIRE(bus.subscriber_count(ApprovalResolvedEvent::TAG) == 0);

    bus.subscribe(ApprovalResolvedEvent::TAG, [](const Event&) {});
    bus.subscribe(ApprovalResolvedEvent::TAG, [](const Event&) {});
    REQUIRE(bus.subscriber_count(ApprovalResolvedEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(ApprovalTimedOutEvent::TAG) == 0);
}

// ── Type-safe subscribe helper ──────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe template", "[event_bus]") {
    EventBus bus;
    std::string request_id;
    bool approved = false;

    subscribe<ApprovalResolvedEvent>(bus, [&](const ApprovalResolvedEvent& ev) {
        request_id = ev.request_id;
        approved = ev.approved;
    });

    ApprovalResolvedEvent ev;
    ev.request_id = "call-1";
    ev.approved = true;
    bus.publish(ev);

    REQUIRE(request_id == "call-1");
    REQUIRE(approved);
}

TEST_CASE("EventBus: publish_if tolerates a missing bus", "[event_bus]") {
    TurnStartedEvent ev;
    REQUIRE_NOTHROW(publish_if(nullptr, ev));

    EventBus bus;
    int count = 0;
    bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) { count++; });
    publish_if(&bus, ev);
    REQUIRE(count == 1);
}
