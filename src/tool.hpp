#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace streamgate {

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ToolResult {
    bool success;
    std::string output;
};

// A tool the runtime executes on the server side.
class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const nlohmann::json& args) = 0;
    virtual std::string tool_name() const = 0;
};

// Receives results for tool calls that were suspended waiting on an
// outside party (a client-side tool, a resumed approval).
class ToolResultSink {
public:
    virtual ~ToolResultSink() = default;
    // Returns false when the result could not be delivered.
    virtual bool submit_result(const std::string& tool_call_id, const nlohmann::json& result) = 0;
};

// Function-response body for a tool result:
// {"success": true, "result": ...} or {"success": false, "error": "..."}.
// A successful output that parses as JSON is embedded as JSON.
nlohmann::json tool_result_to_response(const ToolResult& result);

// Inverse of tool_result_to_response for client-submitted payloads.
ToolResult tool_result_from_response(const nlohmann::json& response);

} // namespace streamgate
