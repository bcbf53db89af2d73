#include "tool.hpp"

namespace streamgate {

nlohmann::json tool_result_to_response(const ToolResult& result) {
    if (!result.success) {
        return {{"success", false}, {"error", result.output}};
    }
    nlohmann::json value = nlohmann::json::parse(result.output, nullptr, false);
    if (value.is_discarded()) value = result.output;
    return {{"success", true}, {"result", value}};
}

ToolResult tool_result_from_response(const nlohmann::json& response) {
    if (response.is_string()) {
        return ToolResult{true, response.get<std::string>()};
    }
    if (!response.is_object()) {
        return ToolResult{true, response.dump()};
    }

    bool failed = response.contains("success") && response["success"].is_boolean() &&
                  !response["success"].get<bool>();
    bool error_only = response.contains("error") &&
                      (!response.contains("result") || response["result"].is_null());
    if (failed || error_only) {
        std::string error = "Unknown tool error";
        if (response.contains("error") && response["error"].is_string()) {
            error = response["error"].get<std::string>();
        } else if (response.contains("error") && !response["error"].is_null()) {
            error = response["error"].dump();
        }
        return ToolResult{false, error};
    }

    if (response.contains("result")) {
        const auto& value = response["result"];
        return ToolResult{true, value.is_string() ? value.get<std::string>() : value.dump()};
    }
    return ToolResult{true, response.dump()};
}

} // namespace streamgate
