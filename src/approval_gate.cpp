#include "approval_gate.hpp"
#include "session.hpp"
#include "log.hpp"

namespace streamgate {

// ── ApprovalGate ────────────────────────────────────────────────

ApprovalGate::ApprovalGate(ApprovalRegistry& registry, std::chrono::milliseconds default_timeout)
    : registry_(registry), default_timeout_(default_timeout), confirmation_timeout_(default_timeout) {}

ApprovalGate::ApprovalGate(ApprovalRegistry& registry, const Config& config)
    : registry_(registry),
      default_timeout_(config.approval.execution_timeout_ms),
      confirmation_timeout_(config.approval.confirmation_timeout_ms),
      gated_tools_(config.tools) {}

bool ApprovalGate::requires_approval(const std::string& tool_name) const {
    return !gated_tools_ || gated_tools_->requires_approval(tool_name);
}

ApprovalOutcome ApprovalGate::await_confirmation(const ToolCall& call) {
    return await_approval(call, confirmation_timeout_);
}

ApprovalOutcome ApprovalGate::await_approval(const ToolCall& call,
                                             std::chrono::milliseconds timeout) {
    registry_.register_request(call.id, call.name, call.arguments);
    return registry_.await_decision(call.id, timeout);
}

ToolResult ApprovalGate::run(const ToolCall& call, const ToolExecutor& executor) {
    return run(call, executor, default_timeout_);
}

ToolResult ApprovalGate::run(const ToolCall& call, const ToolExecutor& executor,
                             std::chrono::milliseconds timeout) {
    ApprovalOutcome outcome = await_approval(call, timeout);

    if (outcome.timed_out) {
        return ToolResult{false, "Tool " + call.name + " was not approved: " +
                                 outcome.decision.reason};
    }
    if (!outcome.decision.approved) {
        std::string reason = outcome.decision.reason.empty() ? kDefaultDenialReason
                                                              : outcome.decision.reason;
        return ToolResult{false, reason};
    }

    log_debug("approval", "Executing approved tool " + call.name + " (id=" + call.id + ")");
    return executor(call.arguments);
}

ToolResult ApprovalGate::dispatch(const ToolCall& call, const ToolExecutor& executor) {
    if (!requires_approval(call.name)) return executor(call.arguments);
    return run(call, executor);
}

ToolResult ApprovalGate::run(const ToolCall& call, Tool& tool) {
    return run(call, [&tool](const nlohmann::json& args) { return tool.execute(args); });
}

// ── ApprovalRouter ──────────────────────────────────────────────

ApprovalRouter::ApprovalRouter(Session& session) : session_(session) {}

std::string ApprovalRouter::state_key(const std::string& approval_id) {
    return "approval:" + approval_id;
}

void ApprovalRouter::observe(const Chunk& chunk) {
    if (chunk.type != ChunkType::ToolApprovalRequest) return;
    std::string approval_id = chunk.str("approvalId");
    std::string tool_call_id = chunk.str("toolCallId");
    if (approval_id.empty() || tool_call_id.empty()) {
        log_warn("approval", "Approval request chunk without ids, not routable");
        return;
    }
    session_.set_state(state_key(approval_id), tool_call_id);
}

void ApprovalRouter::observe(const std::vector<Chunk>& chunks) {
    for (const auto& chunk : chunks) observe(chunk);
}

std::optional<std::string> ApprovalRouter::original_call_id(const std::string& approval_id) const {
    auto value = session_.get_state(state_key(approval_id));
    if (!value || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

bool ApprovalRouter::handle_confirmation(const std::string& approval_id,
                                         const nlohmann::json& payload) {
    auto original = original_call_id(approval_id);
    if (!original) {
        log_warn("approval", "Confirmation for unknown approval " + approval_id + ", ignoring");
        return false;
    }
    if (!payload.is_object()) {
        log_warn("approval", "Confirmation payload for " + approval_id + " is not an object");
        return false;
    }

    ApprovalDecision decision;
    if (payload.contains("approved") && payload["approved"].is_boolean()) {
        decision.approved = payload["approved"].get<bool>();
    } else if (payload.contains("confirmed") && payload["confirmed"].is_boolean()) {
        decision.approved = payload["confirmed"].get<bool>();
    } else {
        log_warn("approval", "Confirmation for " + approval_id + " has no approved/confirmed flag");
        return false;
    }
    if (payload.contains("reason") && payload["reason"].is_string()) {
        decision.reason = payload["reason"].get<std::string>();
    }

    bool delivered = session_.approvals().resolve(*original, decision);
    if (delivered) session_.erase_state(state_key(approval_id));
    return delivered;
}

} // namespace streamgate
