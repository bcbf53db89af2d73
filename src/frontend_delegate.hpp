#pragma once
#include "tool.hpp"
#include "config.hpp"
#include <string>
#include <chrono>
#include <future>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace streamgate {

constexpr const char* kConfirmationIdPrefix = "confirmation-";

// Rendezvous for tools that run in the client. The runtime thread blocks in
// execute_on_frontend() while the transport delivers the client's result via
// submit_result(). A result that arrives first is cached for the next wait.
class FrontendToolDelegate : public ToolResultSink {
public:
    explicit FrontendToolDelegate(std::chrono::milliseconds default_timeout);
    // Default timeout from tools.frontend_timeout_ms
    explicit FrontendToolDelegate(const Config& config);

    ToolResult execute_on_frontend(const std::string& tool_call_id, const std::string& tool_name);
    ToolResult execute_on_frontend(const std::string& tool_call_id, const std::string& tool_name,
                                   std::chrono::milliseconds timeout);

    // Delivers to a waiting call (ids prefixed with "confirmation-" also match
    // the unprefixed call) or caches the result. Always accepted.
    bool submit_result(const std::string& tool_call_id, const nlohmann::json& result) override;

    // Fail a waiting call. Returns false when nothing is waiting on the id.
    bool reject(const std::string& tool_call_id, const std::string& error_message);

    size_t pending_count() const;
    size_t cached_count() const;

private:
    std::chrono::milliseconds default_timeout_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::promise<nlohmann::json>> pending_;
    std::unordered_map<std::string, nlohmann::json> pre_resolved_;
};

} // namespace streamgate
