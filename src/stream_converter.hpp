#pragma once
#include "chunk.hpp"
#include "runtime_event.hpp"
#include <string>
#include <vector>
#include <set>
#include <nlohmann/json.hpp>

namespace streamgate {

class EventBus;
struct Config;

// Runtime's synthetic error response for a call that is waiting on the
// confirmation tool. Never surfaced to clients.
extern const char* const kConfirmationRequiredMessage;

struct ConverterOptions {
    std::string confirmation_tool = "adk_request_confirmation";
    std::string agent_model;       // modelVersion fallback
    bool hold_turn_while_awaiting_approval = true;
    std::string message_id;        // first turn's id; generated when empty

    static ConverterOptions from_config(const Config& config);
};

enum class ToolCallState { Announced, InputAvailable, OutputAvailable, OutputError };

const char* tool_call_state_to_string(ToolCallState state);

struct ToolCallRecord {
    std::string id;
    std::string name;
    nlohmann::json input = nlohmann::json::object();
    ToolCallState state = ToolCallState::Announced;
    bool internal = false;          // confirmation tool, never surfaced
    std::string original_call_id;   // internal only: call awaiting approval
    nlohmann::json response;        // internal only: confirmation response
};

struct TextBlock {
    std::string id;
    TextChannel channel = TextChannel::Output;
    std::string text;
    bool finished = false;
};

// Per-connection state machine: one runtime event in, zero or more ordered
// protocol chunks out. Idle until the first event of a turn, Active until a
// turn-complete or error closes it with exactly one terminal marker.
// Owned by a single processing context; not thread-safe.
class StreamConverter {
public:
    explicit StreamConverter(ConverterOptions options = {}, EventBus* bus = nullptr);

    std::vector<Chunk> convert(const RuntimeEvent& event);

    // Close the current turn normally (open blocks end, finish, terminal).
    // Empty when idle.
    std::vector<Chunk> finish_turn();

    // Close the current turn with an error chunk and terminal marker. Starts
    // a turn first when idle so the client still sees a complete turn.
    std::vector<Chunk> fail_turn(const std::string& error_text);

    bool active() const { return active_; }
    bool holding_turn() const { return turn_held_; }

    // Current turn's id (or the last turn's when idle)
    const std::string& message_id() const { return message_id_; }
    size_t turns_completed() const { return turns_completed_; }

    const std::vector<ToolCallRecord>& tool_calls() const { return tool_calls_; }
    const std::vector<TextBlock>& text_blocks() const { return blocks_; }

    // Original tool-call ids with an approval request but no output yet
    const std::set<std::string>& awaiting_approval() const { return awaiting_approval_; }

    // Stable block id for a channel within a turn
    static std::string block_id(const std::string& message_id, TextChannel channel);

private:
    void begin_turn(std::vector<Chunk>& out);
    void end_turn(bool errored, size_t chunk_count);

    void on_text(const RuntimeEvent& event, std::vector<Chunk>& out);
    void on_function_call(const RuntimeEvent& event, std::vector<Chunk>& out);
    void on_confirmation_call(const RuntimeEvent& event, std::vector<Chunk>& out);
    void on_function_response(const RuntimeEvent& event, std::vector<Chunk>& out);
    void on_turn_complete(const RuntimeEvent& event, std::vector<Chunk>& out);

    void close_open_blocks(std::vector<Chunk>& out);
    void append_finish(std::vector<Chunk>& out);

    TextBlock* open_block(TextChannel channel);
    ToolCallRecord* find_call(const std::string& id);
    ToolCallRecord& record_call(const RuntimeEvent& event, bool internal);

    ConverterOptions options_;
    EventBus* bus_;

    bool active_ = false;
    bool turn_held_ = false;
    bool first_turn_ = true;
    std::string message_id_;
    size_t turns_completed_ = 0;
    size_t turn_chunks_ = 0;

    std::vector<TextBlock> blocks_;
    std::vector<ToolCallRecord> tool_calls_;
    std::set<std::string> input_started_;
    std::set<std::string> input_available_;
    std::set<std::string> approval_requested_;   // approval ids already emitted
    std::set<std::string> awaiting_approval_;

    std::string finish_reason_;
    std::string model_version_;
    bool has_usage_ = false;
    Usage usage_;
};

} // namespace streamgate
