#include "chunk.hpp"
#include "sse.hpp"
#include "log.hpp"
#include "util.hpp"

namespace streamgate {

const char* const kTerminalFrame = "data: [DONE]\n\n";

static const char* const kTerminalPayload = "[DONE]";

const char* chunk_type_to_string(ChunkType type) {
    switch (type) {
        case ChunkType::Start: return "start";
        case ChunkType::TextStart: return "text-start";
        case ChunkType::TextDelta: return "text-delta";
        case ChunkType::TextEnd: return "text-end";
        case ChunkType::ToolInputStart: return "tool-input-start";
        case ChunkType::ToolInputAvailable: return "tool-input-available";
        case ChunkType::ToolApprovalRequest: return "tool-approval-request";
        case ChunkType::ToolOutputAvailable: return "tool-output-available";
        case ChunkType::ToolOutputError: return "tool-output-error";
        case ChunkType::Finish: return "finish";
        case ChunkType::Error: return "error";
        case ChunkType::Terminal: return kTerminalPayload;
    }
    return "error";
}

std::optional<ChunkType> chunk_type_from_string(const std::string& name) {
    static const ChunkType all[] = {
        ChunkType::Start, ChunkType::TextStart, ChunkType::TextDelta, ChunkType::TextEnd,
        ChunkType::ToolInputStart, ChunkType::ToolInputAvailable,
        ChunkType::ToolApprovalRequest, ChunkType::ToolOutputAvailable,
        ChunkType::ToolOutputError, ChunkType::Finish, ChunkType::Error,
        ChunkType::Terminal,
    };
    for (ChunkType t : all) {
        if (name == chunk_type_to_string(t)) return t;
    }
    return std::nullopt;
}

// ── Chunk ───────────────────────────────────────────────────────

std::string Chunk::str(const char* key) const {
    if (fields.contains(key) && fields[key].is_string()) return fields[key].get<std::string>();
    return "";
}

nlohmann::json Chunk::to_json() const {
    if (type == ChunkType::Terminal) return kTerminalPayload;
    nlohmann::json j = {{"type", chunk_type_to_string(type)}};
    for (auto& [key, value] : fields.items()) {
        j[key] = value;
    }
    return j;
}

static Chunk make_chunk(ChunkType type, nlohmann::json fields) {
    Chunk c;
    c.type = type;
    c.fields = std::move(fields);
    return c;
}

Chunk Chunk::start(const std::string& message_id) {
    return make_chunk(ChunkType::Start, {{"messageId", message_id}});
}

Chunk Chunk::text_start(const std::string& block_id) {
    return make_chunk(ChunkType::TextStart, {{"id", block_id}});
}

Chunk Chunk::text_delta(const std::string& block_id, const std::string& delta) {
    return make_chunk(ChunkType::TextDelta, {{"id", block_id}, {"delta", delta}});
}

Chunk Chunk::text_end(const std::string& block_id) {
    return make_chunk(ChunkType::TextEnd, {{"id", block_id}});
}

Chunk Chunk::tool_input_start(const std::string& tool_call_id, const std::string& tool_name) {
    return make_chunk(ChunkType::ToolInputStart,
                      {{"toolCallId", tool_call_id}, {"toolName", tool_name}});
}

Chunk Chunk::tool_input_available(const std::string& tool_call_id,
                                  const std::string& tool_name,
                                  const nlohmann::json& input) {
    return make_chunk(ChunkType::ToolInputAvailable,
                      {{"toolCallId", tool_call_id}, {"toolName", tool_name},
                       {"input", input.is_null() ? nlohmann::json::object() : input}});
}

Chunk Chunk::tool_approval_request(const std::string& tool_call_id,
                                   const std::string& approval_id) {
    return make_chunk(ChunkType::ToolApprovalRequest,
                      {{"toolCallId", tool_call_id}, {"approvalId", approval_id}});
}

Chunk Chunk::tool_output_available(const std::string& tool_call_id,
                                   const nlohmann::json& output) {
    return make_chunk(ChunkType::ToolOutputAvailable,
                      {{"toolCallId", tool_call_id}, {"output", output}});
}

Chunk Chunk::tool_output_error(const std::string& tool_call_id, const std::string& error_text) {
    return make_chunk(ChunkType::ToolOutputError,
                      {{"toolCallId", tool_call_id}, {"errorText", error_text}});
}

Chunk Chunk::finish(const std::string& finish_reason, const nlohmann::json& message_metadata) {
    nlohmann::json fields = {{"finishReason", finish_reason}};
    if (message_metadata.is_object() && !message_metadata.empty()) {
        fields["messageMetadata"] = message_metadata;
    }
    return make_chunk(ChunkType::Finish, std::move(fields));
}

Chunk Chunk::error(const std::string& error_text) {
    return make_chunk(ChunkType::Error, {{"errorText", error_text}});
}

Chunk Chunk::terminal() {
    return make_chunk(ChunkType::Terminal, nlohmann::json::object());
}

std::optional<Chunk> chunk_from_json(const nlohmann::json& j) {
    if (j.is_string() && j.get<std::string>() == kTerminalPayload) {
        return Chunk::terminal();
    }
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return std::nullopt;
    }
    auto type = chunk_type_from_string(j["type"].get<std::string>());
    if (!type || *type == ChunkType::Terminal) return std::nullopt;

    nlohmann::json fields = j;
    fields.erase("type");
    return make_chunk(*type, std::move(fields));
}

// ── SSE framing ─────────────────────────────────────────────────

std::string format_sse(const Chunk& chunk) {
    if (chunk.is_terminal()) return kTerminalFrame;
    return "data: " + chunk.to_json().dump() + "\n\n";
}

std::vector<Chunk> parse_chunk_frames(const std::string& sse_text) {
    std::vector<Chunk> chunks;
    SSEParser parser;
    auto on_event = [&](const SSEEvent& ev) {
        if (ev.data == kTerminalPayload) {
            chunks.push_back(Chunk::terminal());
            return true;
        }
        try {
            auto parsed = chunk_from_json(nlohmann::json::parse(ev.data));
            if (parsed) {
                chunks.push_back(std::move(*parsed));
            } else {
                log_debug("sse", "Skipping frame with unknown chunk type");
            }
        } catch (const nlohmann::json::parse_error& e) {
            log_warn("sse", std::string("Skipping malformed frame: ") + e.what());
        }
        return true;
    };
    parser.feed(sse_text, on_event);
    parser.flush(on_event);
    return chunks;
}

// ── Finish reasons ──────────────────────────────────────────────

std::string map_finish_reason(const std::string& runtime_reason) {
    if (runtime_reason.empty()) return "stop";

    std::string reason = runtime_reason;
    // Accept qualified enum names such as "FinishReason.MAX_TOKENS"
    size_t dot = reason.rfind('.');
    if (dot != std::string::npos) reason = reason.substr(dot + 1);

    static const char* const content_filter[] = {
        "SAFETY", "RECITATION", "BLOCKLIST", "PROHIBITED_CONTENT", "SPII",
        "IMAGE_SAFETY", "IMAGE_RECITATION", "IMAGE_PROHIBITED_CONTENT", "LANGUAGE",
    };
    static const char* const errors[] = {
        "MALFORMED_FUNCTION_CALL", "UNEXPECTED_TOOL_CALL", "NO_IMAGE",
    };

    if (reason == "STOP" || reason == "FINISH_REASON_UNSPECIFIED") return "stop";
    if (reason == "MAX_TOKENS") return "length";
    for (const char* name : content_filter) {
        if (reason == name) return "content-filter";
    }
    for (const char* name : errors) {
        if (reason == name) return "error";
    }
    if (reason == "OTHER" || reason == "IMAGE_OTHER") return "other";
    return to_lower(reason);
}

} // namespace streamgate
