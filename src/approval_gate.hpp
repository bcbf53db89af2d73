#pragma once
#include "approval_registry.hpp"
#include "chunk.hpp"
#include "tool.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace streamgate {

class Session;

constexpr const char* kDefaultDenialReason = "User denied the tool call";

using ToolExecutor = std::function<ToolResult(const nlohmann::json& args)>;

// Wraps a sensitive tool: registers an approval request under the call's
// id, suspends the calling thread until a decision or the deadline, and only
// then runs the tool.
class ApprovalGate {
public:
    // Gates every tool; both timeouts are default_timeout
    ApprovalGate(ApprovalRegistry& registry, std::chrono::milliseconds default_timeout);
    // Gates tools.approval_required only. run() waits approval.execution_timeout_ms,
    // await_confirmation() waits approval.confirmation_timeout_ms.
    ApprovalGate(ApprovalRegistry& registry, const Config& config);

    ToolResult run(const ToolCall& call, const ToolExecutor& executor);
    ToolResult run(const ToolCall& call, const ToolExecutor& executor,
                   std::chrono::milliseconds timeout);
    ToolResult run(const ToolCall& call, Tool& tool);

    // Gated tools go through run(), the rest execute directly
    ToolResult dispatch(const ToolCall& call, const ToolExecutor& executor);

    bool requires_approval(const std::string& tool_name) const;

    // Register and wait without running anything
    ApprovalOutcome await_approval(const ToolCall& call, std::chrono::milliseconds timeout);
    ApprovalOutcome await_confirmation(const ToolCall& call);

    std::chrono::milliseconds execution_timeout() const { return default_timeout_; }
    std::chrono::milliseconds confirmation_timeout() const { return confirmation_timeout_; }

private:
    ApprovalRegistry& registry_;
    std::chrono::milliseconds default_timeout_;
    std::chrono::milliseconds confirmation_timeout_;
    std::optional<ToolsConfig> gated_tools_;  // nullopt = every tool
};

// Turns client confirmation messages into registry decisions. The
// approval-id -> tool-call-id mapping is learned from outgoing
// tool-approval-request chunks and kept in the session's state map.
class ApprovalRouter {
public:
    explicit ApprovalRouter(Session& session);

    // Record mappings from any tool-approval-request chunks
    void observe(const Chunk& chunk);
    void observe(const std::vector<Chunk>& chunks);

    // Payload: {"approved": bool} or {"confirmed": bool}, optional "reason".
    // Returns false for an unknown approval id or an unusable payload.
    bool handle_confirmation(const std::string& approval_id, const nlohmann::json& payload);

    std::optional<std::string> original_call_id(const std::string& approval_id) const;

    static std::string state_key(const std::string& approval_id);

private:
    Session& session_;
};

} // namespace streamgate
