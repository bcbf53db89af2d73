#include "runtime_event.hpp"
#include <stdexcept>

namespace streamgate {

const char* runtime_event_kind_to_string(RuntimeEventKind kind) {
    switch (kind) {
        case RuntimeEventKind::TextDelta: return "text-delta";
        case RuntimeEventKind::TranscriptionDelta: return "transcription";
        case RuntimeEventKind::FunctionCallAnnounced: return "function-call";
        case RuntimeEventKind::FunctionCallReady: return "function-call-ready";
        case RuntimeEventKind::FunctionResponse: return "function-response";
        case RuntimeEventKind::TurnComplete: return "turn-complete";
        case RuntimeEventKind::Error: return "error";
        case RuntimeEventKind::UsageMetadata: return "usage";
        case RuntimeEventKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* text_channel_to_string(TextChannel channel) {
    switch (channel) {
        case TextChannel::Output: return "output";
        case TextChannel::Input: return "input";
    }
    return "output";
}

// ── Named constructors ──────────────────────────────────────────

RuntimeEvent RuntimeEvent::text_delta(const std::string& text, bool finished) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::TextDelta;
    ev.channel = TextChannel::Output;
    ev.text = text;
    ev.finished = finished;
    return ev;
}

RuntimeEvent RuntimeEvent::transcription(TextChannel channel, const std::string& text,
                                         bool finished) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::TranscriptionDelta;
    ev.channel = channel;
    ev.text = text;
    ev.finished = finished;
    return ev;
}

RuntimeEvent RuntimeEvent::function_call(const std::string& id, const std::string& name,
                                         const nlohmann::json& args) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::FunctionCallAnnounced;
    ev.call_id = id;
    ev.tool_name = name;
    ev.payload = args;
    ev.has_args = true;
    return ev;
}

RuntimeEvent RuntimeEvent::function_call_started(const std::string& id, const std::string& name) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::FunctionCallAnnounced;
    ev.call_id = id;
    ev.tool_name = name;
    ev.payload = nlohmann::json::object();
    ev.has_args = false;
    return ev;
}

RuntimeEvent RuntimeEvent::function_call_ready(const std::string& id, const std::string& name,
                                               const nlohmann::json& args) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::FunctionCallReady;
    ev.call_id = id;
    ev.tool_name = name;
    ev.payload = args;
    ev.has_args = true;
    return ev;
}

RuntimeEvent RuntimeEvent::function_response(const std::string& id, const std::string& name,
                                             const nlohmann::json& response) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::FunctionResponse;
    ev.call_id = id;
    ev.tool_name = name;
    ev.payload = response;
    return ev;
}

RuntimeEvent RuntimeEvent::turn_complete(const std::string& finish_reason,
                                         const std::string& model_version) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::TurnComplete;
    ev.finish_reason = finish_reason;
    ev.model_version = model_version;
    return ev;
}

RuntimeEvent RuntimeEvent::error(const std::string& message, const std::string& code) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::Error;
    ev.error_message = message;
    ev.error_code = code;
    return ev;
}

RuntimeEvent RuntimeEvent::usage_metadata(const Usage& usage) {
    RuntimeEvent ev;
    ev.kind = RuntimeEventKind::UsageMetadata;
    ev.usage = usage;
    return ev;
}

// ── Decoding ────────────────────────────────────────────────────

static std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

static std::string required_string(const nlohmann::json& j, const char* key,
                                   const std::string& kind) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw std::invalid_argument(kind + " event missing string field '" + key + "'");
    }
    return j[key].get<std::string>();
}

static uint64_t count_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_unsigned()) return j[key].get<uint64_t>();
    if (j.contains(key) && j[key].is_number_integer()) {
        auto v = j[key].get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return 0;
}

static TextChannel parse_channel(const nlohmann::json& j, TextChannel fallback) {
    std::string channel = string_field(j, "channel");
    if (channel == "input") return TextChannel::Input;
    if (channel == "output") return TextChannel::Output;
    return fallback;
}

static RuntimeEvent decode_object(const nlohmann::json& j) {
    std::string kind = string_field(j, "kind");

    RuntimeEvent ev;
    if (kind == "text-delta") {
        ev = RuntimeEvent::text_delta(required_string(j, "text", kind),
                                      j.value("finished", false));
        ev.channel = parse_channel(j, TextChannel::Output);
    } else if (kind == "transcription") {
        ev = RuntimeEvent::transcription(parse_channel(j, TextChannel::Input),
                                         required_string(j, "text", kind),
                                         j.value("finished", false));
    } else if (kind == "function-call") {
        std::string id = required_string(j, "id", kind);
        std::string name = required_string(j, "name", kind);
        if (j.contains("args")) {
            ev = RuntimeEvent::function_call(id, name, j["args"]);
        } else {
            ev = RuntimeEvent::function_call_started(id, name);
        }
    } else if (kind == "function-call-ready") {
        ev = RuntimeEvent::function_call_ready(required_string(j, "id", kind),
                                               required_string(j, "name", kind),
                                               j.value("args", nlohmann::json::object()));
    } else if (kind == "function-response") {
        ev = RuntimeEvent::function_response(string_field(j, "id"),
                                             required_string(j, "name", kind),
                                             j.value("response", nlohmann::json()));
    } else if (kind == "turn-complete") {
        ev = RuntimeEvent::turn_complete(string_field(j, "finishReason"),
                                         string_field(j, "modelVersion"));
    } else if (kind == "error") {
        std::string message = string_field(j, "message");
        if (message.empty()) message = "Unknown error";
        ev = RuntimeEvent::error(message, string_field(j, "code"));
    } else if (kind == "usage") {
        Usage usage;
        usage.prompt_tokens = count_field(j, "promptTokens");
        usage.completion_tokens = count_field(j, "completionTokens");
        usage.total_tokens = count_field(j, "totalTokens");
        ev = RuntimeEvent::usage_metadata(usage);
    } else {
        ev.kind = RuntimeEventKind::Unknown;
    }
    ev.raw_kind = kind;
    return ev;
}

RuntimeEvent decode_runtime_event(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("runtime event must be a JSON object");
    }
    try {
        return decode_object(j);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("runtime event field has wrong type: ") +
                                    e.what());
    }
}

RuntimeEvent decode_runtime_event_line(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("malformed runtime event: ") + e.what());
    }
    return decode_runtime_event(j);
}

nlohmann::json encode_runtime_event(const RuntimeEvent& event) {
    nlohmann::json j;
    switch (event.kind) {
        case RuntimeEventKind::TextDelta:
        case RuntimeEventKind::TranscriptionDelta:
            j["kind"] = runtime_event_kind_to_string(event.kind);
            j["channel"] = text_channel_to_string(event.channel);
            j["text"] = event.text;
            j["finished"] = event.finished;
            break;
        case RuntimeEventKind::FunctionCallAnnounced:
        case RuntimeEventKind::FunctionCallReady:
            j["kind"] = runtime_event_kind_to_string(event.kind);
            j["id"] = event.call_id;
            j["name"] = event.tool_name;
            if (event.has_args) j["args"] = event.payload;
            break;
        case RuntimeEventKind::FunctionResponse:
            j["kind"] = runtime_event_kind_to_string(event.kind);
            j["id"] = event.call_id;
            j["name"] = event.tool_name;
            j["response"] = event.payload;
            break;
        case RuntimeEventKind::TurnComplete:
            j["kind"] = runtime_event_kind_to_string(event.kind);
            if (!event.finish_reason.empty()) j["finishReason"] = event.finish_reason;
            if (!event.model_version.empty()) j["modelVersion"] = event.model_version;
            break;
        case RuntimeEventKind::Error:
            j["kind"] = runtime_event_kind_to_string(event.kind);
            j["message"] = event.error_message;
            if (!event.error_code.empty()) j["code"] = event.error_code;
            break;
        case RuntimeEventKind::UsageMetadata:
            j["kind"] = runtime_event_kind_to_string(event.kind);
            j["promptTokens"] = event.usage.prompt_tokens;
            j["completionTokens"] = event.usage.completion_tokens;
            j["totalTokens"] = event.usage.total_tokens;
            break;
        case RuntimeEventKind::Unknown:
            j["kind"] = event.raw_kind;
            break;
    }
    return j;
}

} // namespace streamgate
