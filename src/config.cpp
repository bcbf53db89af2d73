#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace streamgate {

nlohmann::json Config::defaults_json() {
    return {
        {"log_level", "info"},
        {"approval", {
            {"execution_timeout_ms", 30000},
            {"confirmation_timeout_ms", 60000}
        }},
        {"session", {
            {"app_name", "agents"}
        }},
        {"converter", {
            {"confirmation_tool", "adk_request_confirmation"},
            {"agent_model", ""},
            {"hold_turn_while_awaiting_approval", true}
        }},
        {"tools", {
            {"approval_required", {"process_payment", "get_location"}},
            {"frontend_timeout_ms", 10000}
        }},
        {"chunk_log", {
            {"enabled", false},
            {"output_dir", "./chunk_logs"},
            {"session_id", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_timeout(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t value = obj[key].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
        log_warn("config", std::string("Ignoring out-of-range ") + key + ": " + std::to_string(value));
        return;
    }
    out = static_cast<uint32_t>(value);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("log_level") && j["log_level"].is_string()) {
        auto level = log_level_from_string(j["log_level"].get<std::string>());
        if (level) cfg.log_level = *level;
    }

    if (j.contains("approval") && j["approval"].is_object()) {
        auto& a = j["approval"];
        read_timeout(a, "execution_timeout_ms", cfg.approval.execution_timeout_ms);
        read_timeout(a, "confirmation_timeout_ms", cfg.approval.confirmation_timeout_ms);
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        if (s.contains("app_name") && s["app_name"].is_string())
            cfg.session.app_name = s["app_name"].get<std::string>();
    }

    if (j.contains("converter") && j["converter"].is_object()) {
        auto& c = j["converter"];
        if (c.contains("confirmation_tool") && c["confirmation_tool"].is_string())
            cfg.converter.confirmation_tool = c["confirmation_tool"].get<std::string>();
        if (c.contains("agent_model") && c["agent_model"].is_string())
            cfg.converter.agent_model = c["agent_model"].get<std::string>();
        if (c.contains("hold_turn_while_awaiting_approval") &&
            c["hold_turn_while_awaiting_approval"].is_boolean())
            cfg.converter.hold_turn_while_awaiting_approval =
                c["hold_turn_while_awaiting_approval"].get<bool>();
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        auto& t = j["tools"];
        if (t.contains("approval_required") && t["approval_required"].is_array()) {
            cfg.tools.approval_required.clear();
            for (const auto& name : t["approval_required"]) {
                if (name.is_string()) cfg.tools.approval_required.push_back(name.get<std::string>());
            }
        }
        read_timeout(t, "frontend_timeout_ms", cfg.tools.frontend_timeout_ms);
    }

    if (j.contains("chunk_log") && j["chunk_log"].is_object()) {
        auto& c = j["chunk_log"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.chunk_log.enabled = c["enabled"].get<bool>();
        if (c.contains("output_dir") && c["output_dir"].is_string())
            cfg.chunk_log.output_dir = c["output_dir"].get<std::string>();
        if (c.contains("session_id") && c["session_id"].is_string())
            cfg.chunk_log.session_id = c["session_id"].get<std::string>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.streamgate/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                log_info("config", "Migrated config with new defaults: " + config_path);
            }
        } catch (const nlohmann::json::exception& e) {
            log_warn("config", std::string("Malformed config, using defaults: ") + e.what());
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            log_info("config", "Created default config: " + config_path);
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("STREAMGATE_LOG_LEVEL")) {
        auto level = log_level_from_string(v);
        if (level) {
            log_level = *level;
        } else {
            log_warn("config", std::string("Ignoring unknown STREAMGATE_LOG_LEVEL: ") + v);
        }
    }
    if (const char* v = std::getenv("CHUNK_LOGGER_ENABLED")) {
        chunk_log.enabled = to_lower(trim(v)) == "true";
    }
    if (const char* v = std::getenv("CHUNK_LOGGER_OUTPUT_DIR")) {
        if (*v) chunk_log.output_dir = v;
    }
    if (const char* v = std::getenv("CHUNK_LOGGER_SESSION_ID")) {
        if (*v) chunk_log.session_id = v;
    }
}

bool ToolsConfig::requires_approval(const std::string& tool_name) const {
    return std::find(approval_required.begin(), approval_required.end(),
                     tool_name) != approval_required.end();
}

bool Config::requires_approval(const std::string& tool_name) const {
    return tools.requires_approval(tool_name);
}

} // namespace streamgate
