#pragma once
#include "log.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace streamgate {

struct ApprovalConfig {
    uint32_t execution_timeout_ms = 30000;    // tool blocked on approval
    uint32_t confirmation_timeout_ms = 60000; // interactive confirmation UI
};

struct SessionConfig {
    std::string app_name = "agents";
};

struct ConverterConfig {
    std::string confirmation_tool = "adk_request_confirmation";
    std::string agent_model;  // modelVersion fallback, empty = none
    bool hold_turn_while_awaiting_approval = true;
};

struct ToolsConfig {
    std::vector<std::string> approval_required = {"process_payment", "get_location"};
    uint32_t frontend_timeout_ms = 10000;

    bool requires_approval(const std::string& tool_name) const;
};

struct ChunkLogConfig {
    bool enabled = false;
    std::string output_dir = "./chunk_logs";
    std::string session_id;  // empty = generated from the start time
};

struct Config {
    LogLevel log_level = LogLevel::Info;

    ApprovalConfig approval;
    SessionConfig session;
    ConverterConfig converter;
    ToolsConfig tools;
    ChunkLogConfig chunk_log;

    // Load from ~/.streamgate/config.json + env vars
    static Config load();

    // Build from an already-parsed JSON object (missing keys keep defaults).
    // Does not read env vars or touch the filesystem.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply STREAMGATE_* / CHUNK_LOGGER_* environment overrides
    void apply_env_overrides();

    bool requires_approval(const std::string& tool_name) const;
};

} // namespace streamgate
