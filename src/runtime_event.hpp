#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace streamgate {

// Closed set of event kinds the agent runtime emits. Decoded once at the
// boundary; the converter switches over these exhaustively.
enum class RuntimeEventKind {
    TextDelta,
    TranscriptionDelta,
    FunctionCallAnnounced,
    FunctionCallReady,
    FunctionResponse,
    TurnComplete,
    Error,
    UsageMetadata,
    Unknown
};

enum class TextChannel { Output, Input };

const char* runtime_event_kind_to_string(RuntimeEventKind kind);
const char* text_channel_to_string(TextChannel channel);

struct Usage {
    uint64_t prompt_tokens = 0;
    uint64_t completion_tokens = 0;
    uint64_t total_tokens = 0;
};

struct RuntimeEvent {
    RuntimeEventKind kind = RuntimeEventKind::Unknown;

    // TextDelta / TranscriptionDelta
    TextChannel channel = TextChannel::Output;
    std::string text;
    bool finished = false;

    // FunctionCall* / FunctionResponse
    std::string call_id;
    std::string tool_name;
    nlohmann::json payload;   // call arguments or response body
    bool has_args = false;    // announced call already carries full arguments

    // TurnComplete
    std::string finish_reason;
    std::string model_version;

    // Error
    std::string error_code;
    std::string error_message;

    // UsageMetadata
    Usage usage;

    std::string raw_kind; // wire kind as received (kept for Unknown)

    static RuntimeEvent text_delta(const std::string& text, bool finished = false);
    static RuntimeEvent transcription(TextChannel channel, const std::string& text,
                                      bool finished = false);
    static RuntimeEvent function_call(const std::string& id, const std::string& name,
                                      const nlohmann::json& args);
    static RuntimeEvent function_call_started(const std::string& id, const std::string& name);
    static RuntimeEvent function_call_ready(const std::string& id, const std::string& name,
                                            const nlohmann::json& args);
    static RuntimeEvent function_response(const std::string& id, const std::string& name,
                                          const nlohmann::json& response);
    static RuntimeEvent turn_complete(const std::string& finish_reason = "",
                                      const std::string& model_version = "");
    static RuntimeEvent error(const std::string& message, const std::string& code = "");
    static RuntimeEvent usage_metadata(const Usage& usage);
};

// Decode the wire form {"kind": "...", ...}. Unrecognised kinds decode to
// RuntimeEventKind::Unknown. Throws std::invalid_argument if the value is
// not a JSON object or a recognised kind is missing a required field.
RuntimeEvent decode_runtime_event(const nlohmann::json& j);

// Parse one JSON line then decode it. Throws std::invalid_argument on
// malformed JSON.
RuntimeEvent decode_runtime_event_line(const std::string& line);

nlohmann::json encode_runtime_event(const RuntimeEvent& event);

} // namespace streamgate
