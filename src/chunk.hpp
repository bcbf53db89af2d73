#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace streamgate {

enum class ChunkType {
    Start,
    TextStart,
    TextDelta,
    TextEnd,
    ToolInputStart,
    ToolInputAvailable,
    ToolApprovalRequest,
    ToolOutputAvailable,
    ToolOutputError,
    Finish,
    Error,
    Terminal   // out-of-band end-of-turn marker
};

const char* chunk_type_to_string(ChunkType type);
std::optional<ChunkType> chunk_type_from_string(const std::string& name);

// SSE line carrying the terminal marker.
extern const char* const kTerminalFrame;

struct Chunk {
    ChunkType type = ChunkType::Start;
    nlohmann::json fields = nlohmann::json::object(); // everything except "type"

    bool is_terminal() const { return type == ChunkType::Terminal; }
    bool ends_turn() const { return type == ChunkType::Finish || type == ChunkType::Error; }

    // String field accessor; empty when missing or not a string.
    std::string str(const char* key) const;

    // {"type": ..., <fields>}. The terminal marker encodes as the string "[DONE]".
    nlohmann::json to_json() const;

    static Chunk start(const std::string& message_id);
    static Chunk text_start(const std::string& block_id);
    static Chunk text_delta(const std::string& block_id, const std::string& delta);
    static Chunk text_end(const std::string& block_id);
    static Chunk tool_input_start(const std::string& tool_call_id, const std::string& tool_name);
    static Chunk tool_input_available(const std::string& tool_call_id,
                                      const std::string& tool_name,
                                      const nlohmann::json& input);
    static Chunk tool_approval_request(const std::string& tool_call_id,
                                       const std::string& approval_id);
    static Chunk tool_output_available(const std::string& tool_call_id,
                                       const nlohmann::json& output);
    static Chunk tool_output_error(const std::string& tool_call_id,
                                   const std::string& error_text);
    static Chunk finish(const std::string& finish_reason,
                        const nlohmann::json& message_metadata = nlohmann::json::object());
    static Chunk error(const std::string& error_text);
    static Chunk terminal();
};

// Build a chunk from its JSON object form. Returns nullopt for unknown types.
std::optional<Chunk> chunk_from_json(const nlohmann::json& j);

// "data: <json>\n\n", or kTerminalFrame for the terminal marker.
std::string format_sse(const Chunk& chunk);

// Map a runtime finish reason (e.g. "MAX_TOKENS") onto the protocol's
// finishReason vocabulary. Empty maps to "stop".
std::string map_finish_reason(const std::string& runtime_reason);

// Parse a complete SSE byte stream back into chunks. Frames with
// malformed JSON or unknown chunk types are skipped.
std::vector<Chunk> parse_chunk_frames(const std::string& sse_text);

} // namespace streamgate
