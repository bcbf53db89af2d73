#include <catch2/catch.hpp>
#include "approval_gate.hpp"
#include "session.hpp"
#include "stream_converter.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace streamgate;
using namespace std::chrono_literals;
using json = nlohmann::json;

class PaymentTool : public Tool {
public:
    ToolResult execute(const json& args) override {
        calls++;
        return ToolResult{true, json{{"status", "paid"}, {"amount", args.value("amount", 0)}}.dump()};
    }
    std::string tool_name() const override { return "process_payment"; }

    int calls = 0;
};

static ToolCall payment_call(const std::string& id) {
    return ToolCall{id, "process_payment", json{{"amount", 42}}};
}

// Poll until the registry has the request, so resolve() finds it
static void wait_registered(ApprovalRegistry& registry, const std::string& id) {
    for (int i = 0; i < 200; i++) {
        for (const auto& req : registry.pending_requests()) {
            if (req.id == id) return;
        }
        std::this_thread::sleep_for(5ms);
    }
}

// ── ApprovalGate ────────────────────────────────────────────────

TEST_CASE("ApprovalGate: approved call runs the tool", "[approval_gate]") {
    ApprovalRegistry registry;
    ApprovalGate gate(registry, 5000ms);
    PaymentTool tool;

    auto result = std::async(std::launch::async, [&] { return gate.run(payment_call("c1"), tool); });
    wait_registered(registry, "c1");
    REQUIRE(registry.resolve("c1", ApprovalDecision{true, ""}));

    ToolResult r = result.get();
    REQUIRE(r.success);
    REQUIRE(json::parse(r.output)["amount"] == 42);
    REQUIRE(tool.calls == 1);
}

TEST_CASE("ApprovalGate: denied call never runs the tool", "[approval_gate]") {
    ApprovalRegistry registry;
    ApprovalGate gate(registry, 5000ms);
    PaymentTool tool;

    auto result = std::async(std::launch::async, [&] { return gate.run(payment_call("c1"), tool); });
    wait_registered(registry, "c1");
    registry.resolve("c1", ApprovalDecision{false, ""});

    ToolResult r = result.get();
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == kDefaultDenialReason);
    REQUIRE(tool.calls == 0);
}

TEST_CASE("ApprovalGate: denial reason is passed through", "[approval_gate]") {
    ApprovalRegistry registry;
    ApprovalGate gate(registry, 5000ms);
    std::atomic<bool> ran{false};

    auto result = std::async(std::launch::async, [&] {
        return gate.run(payment_call("c1"), [&](const json&) {
            ran = true;
            return ToolResult{true, "ok"};
        });
    });
    wait_registered(registry, "c1");
    registry.resolve("c1", ApprovalDecision{false, "Amount over limit"});

    REQUIRE(result.get().output == "Amount over limit");
    REQUIRE_FALSE(ran.load());
}

TEST_CASE("ApprovalGate: timeout result names the tool and the deadline", "[approval_gate]") {
    ApprovalRegistry registry;
    ApprovalGate gate(registry, 5000ms);
    PaymentTool tool;

    auto start = std::chrono::steady_clock::now();
    ToolResult r = gate.run(payment_call("c1"), [&](const json& a) { return tool.execute(a); }, 100ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Tool process_payment was not approved: Approval timeout after 100ms");
    REQUIRE(elapsed >= 100ms);
    REQUIRE(tool.calls == 0);
    REQUIRE(registry.pending_count() == 0);
}

// ── End to end through the converter ────────────────────────────

TEST_CASE("ApprovalGate: unanswered approval streams a timeout error then finishes", "[approval_gate]") {
    ApprovalRegistry registry;
    ApprovalGate gate(registry, 150ms);
    StreamConverter conv;
    std::vector<Chunk> chunks;
    auto collect = [&](const std::vector<Chunk>& out) {
        chunks.insert(chunks.end(), out.begin(), out.end());
    };

    collect(conv.convert(RuntimeEvent::function_call("call-1", "process_payment", json{{"amount", 42}})));
    collect(conv.convert(RuntimeEvent::function_call(
        "conf-1", "adk_request_confirmation",
        json{{"originalFunctionCall", {{"id", "call-1"}, {"name", "process_payment"}}}})));
    collect(conv.convert(RuntimeEvent::turn_complete()));
    REQUIRE(conv.holding_turn());
    auto requested_at = std::chrono::steady_clock::now();

    PaymentTool tool;
    ToolResult r = gate.run(payment_call("call-1"), tool);
    auto waited = std::chrono::steady_clock::now() - requested_at;

    collect(conv.convert(RuntimeEvent::function_response("call-1", "process_payment",
                                                         tool_result_to_response(r))));
    collect(conv.convert(RuntimeEvent::turn_complete()));

    REQUIRE(waited >= 150ms);
    REQUIRE(chunks.size() >= 3);
    const auto& error = chunks[chunks.size() - 3];
    REQUIRE(error.type == ChunkType::ToolOutputError);
    REQUIRE(error.str("toolCallId") == "call-1");
    REQUIRE(error.str("errorText").find("timeout") != std::string::npos);
    REQUIRE(chunks[chunks.size() - 2].type == ChunkType::Finish);
    REQUIRE(chunks.back().is_terminal());
    REQUIRE(tool.calls == 0);
}

// ── ApprovalRouter ──────────────────────────────────────────────

TEST_CASE("ApprovalRouter: maps approval id to the original call", "[approval_gate]") {
    auto registry = std::make_shared<ApprovalRegistry>();
    Session session("s", "alice", "", registry);
    ApprovalRouter router(session);

    router.observe(std::vector<Chunk>{
        Chunk::tool_input_start("call-1", "process_payment"),
        Chunk::tool_approval_request("call-1", "conf-1"),
    });
    REQUIRE(router.original_call_id("conf-1") == std::optional<std::string>("call-1"));
    REQUIRE(session.get_state(ApprovalRouter::state_key("conf-1")).has_value());
    REQUIRE_FALSE(router.original_call_id("conf-2").has_value());
}

TEST_CASE("ApprovalRouter: confirmation resolves the registry", "[approval_gate]") {
    auto registry = std::make_shared<ApprovalRegistry>();
    Session session("s", "alice", "", registry);
    ApprovalRouter router(session);
    router.observe(Chunk::tool_approval_request("call-1", "conf-1"));
    registry->register_request("call-1", "process_payment");

    REQUIRE(router.handle_confirmation("conf-1", json{{"confirmed", false}, {"reason", "no"}}));
    auto outcome = registry->await_decision("call-1", 1000ms);
    REQUIRE_FALSE(outcome.decision.approved);
    REQUIRE(outcome.decision.reason == "no");

    // Mapping is dropped once delivered
    REQUIRE_FALSE(router.original_call_id("conf-1").has_value());
}

TEST_CASE("ApprovalRouter: unusable confirmations are rejected", "[approval_gate]") {
    auto registry = std::make_shared<ApprovalRegistry>();
    Session session("s", "alice", "", registry);
    ApprovalRouter router(session);
    router.observe(Chunk::tool_approval_request("call-1", "conf-1"));
    registry->register_request("call-1", "process_payment");

    REQUIRE_FALSE(router.handle_confirmation("unknown", json{{"approved", true}}));
    REQUIRE_FALSE(router.handle_confirmation("conf-1", json("yes")));
    REQUIRE_FALSE(router.handle_confirmation("conf-1", json{{"reason", "missing flag"}}));
    REQUIRE(registry->pending_count() == 1);

    REQUIRE(router.handle_confirmation("conf-1", json{{"approved", true}}));
    REQUIRE(registry->await_decision("call-1", 1000ms).decision.approved);
}

// ── Tool result wire form ───────────────────────────────────────

TEST_CASE("tool_result_to_response: success embeds JSON output", "[approval_gate]") {
    auto ok = tool_result_to_response(ToolResult{true, R"({"temp":18})"});
    REQUIRE(ok["success"] == true);
    REQUIRE(ok["result"]["temp"] == 18);

    auto text = tool_result_to_response(ToolResult{true, "plain words"});
    REQUIRE(text["result"] == "plain words");

    auto failed = tool_result_to_response(ToolResult{false, "boom"});
    REQUIRE(failed["success"] == false);
    REQUIRE(failed["error"] == "boom");
}

TEST_CASE("tool_result_from_response: error detection", "[approval_gate]") {
    REQUIRE_FALSE(tool_result_from_response(json{{"error", "x"}}).success);
    REQUIRE_FALSE(tool_result_from_response(json{{"success", false}}).success);
    REQUIRE(tool_result_from_response(json{{"success", false}}).output == "Unknown tool error");
    REQUIRE(tool_result_from_response(json{{"result", "fine"}, {"error", nullptr}}).success);
    REQUIRE(tool_result_from_response(json("just text")).output == "just text");
    REQUIRE(tool_result_from_response(json{{"temp", 18}}).success);
}

// ── Config-driven gate ──────────────────────────────────────────

TEST_CASE("ApprovalGate: config sets timeouts and gated tools", "[approval_gate]") {
    ApprovalRegistry registry;
    Config cfg;
    cfg.approval.execution_timeout_ms = 1500;
    cfg.approval.confirmation_timeout_ms = 2500;
    ApprovalGate gate(registry, cfg);

    REQUIRE(gate.execution_timeout() == 1500ms);
    REQUIRE(gate.confirmation_timeout() == 2500ms);
    REQUIRE(gate.requires_approval("process_payment"));
    REQUIRE(gate.requires_approval("get_location"));
    REQUIRE_FALSE(gate.requires_approval("get_weather"));

    ApprovalGate gate_all(registry, 100ms);
    REQUIRE(gate_all.requires_approval("get_weather"));
    REQUIRE(gate_all.confirmation_timeout() == 100ms);
}

TEST_CASE("ApprovalGate: dispatch runs ungated tools directly", "[approval_gate]") {
    ApprovalRegistry registry;
    Config cfg;
    ApprovalGate gate(registry, cfg);

    ToolResult r = gate.dispatch(ToolCall{"w1", "get_weather", json{{"city", "Oslo"}}},
                                 [](const json& args) {
                                     return ToolResult{true, args["city"].get<std::string>()};
                                 });
    REQUIRE(r.success);
    REQUIRE(r.output == "Oslo");
    REQUIRE(registry.pending_count() == 0);
}

TEST_CASE("ApprovalGate: dispatch holds gated tools for a decision", "[approval_gate]") {
    ApprovalRegistry registry;
    Config cfg;
    cfg.approval.execution_timeout_ms = 5000;
    ApprovalGate gate(registry, cfg);
    PaymentTool tool;

    auto result = std::async(std::launch::async, [&] {
        return gate.dispatch(payment_call("c1"), [&](const json& a) { return tool.execute(a); });
    });
    wait_registered(registry, "c1");
    REQUIRE(tool.calls == 0);
    registry.resolve("c1", ApprovalDecision{true, ""});

    REQUIRE(result.get().success);
    REQUIRE(tool.calls == 1);
}

TEST_CASE("ApprovalGate: await_confirmation uses the confirmation timeout", "[approval_gate]") {
    ApprovalRegistry registry;
    Config cfg;
    cfg.approval.execution_timeout_ms = 5000;
    cfg.approval.confirmation_timeout_ms = 80;
    ApprovalGate gate(registry, cfg);

    auto start = std::chrono::steady_clock::now();
    ApprovalOutcome outcome = gate.await_confirmation(payment_call("c1"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(outcome.timed_out);
    REQUIRE_FALSE(outcome.decision.approved);
    REQUIRE(elapsed >= 80ms);
    REQUIRE(elapsed < 5000ms);
}
