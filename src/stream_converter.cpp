#include "stream_converter.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <algorithm>

namespace streamgate {

const char* const kConfirmationRequiredMessage =
    "This tool call requires confirmation, please approve or reject.";

ConverterOptions ConverterOptions::from_config(const Config& config) {
    ConverterOptions opts;
    opts.confirmation_tool = config.converter.confirmation_tool;
    opts.agent_model = config.converter.agent_model;
    opts.hold_turn_while_awaiting_approval = config.converter.hold_turn_while_awaiting_approval;
    return opts;
}

const char* tool_call_state_to_string(ToolCallState state) {
    switch (state) {
        case ToolCallState::Announced: return "announced";
        case ToolCallState::InputAvailable: return "input-available";
        case ToolCallState::OutputAvailable: return "output-available";
        case ToolCallState::OutputError: return "output-error";
    }
    return "announced";
}

StreamConverter::StreamConverter(ConverterOptions options, EventBus* bus)
    : options_(std::move(options)), bus_(bus) {}

std::string StreamConverter::block_id(const std::string& message_id, TextChannel channel) {
    return message_id + (channel == TextChannel::Input ? "_input_text" : "_output_text");
}

std::vector<Chunk> StreamConverter::convert(const RuntimeEvent& event) {
    std::vector<Chunk> out;

    switch (event.kind) {
        case RuntimeEventKind::TextDelta:
        case RuntimeEventKind::TranscriptionDelta:
            begin_turn(out);
            on_text(event, out);
            break;
        case RuntimeEventKind::FunctionCallAnnounced:
        case RuntimeEventKind::FunctionCallReady:
            begin_turn(out);
            on_function_call(event, out);
            break;
        case RuntimeEventKind::FunctionResponse:
            begin_turn(out);
            on_function_response(event, out);
            break;
        case RuntimeEventKind::TurnComplete:
            on_turn_complete(event, out);
            break;
        case RuntimeEventKind::Error: {
            begin_turn(out);
            std::string text = event.error_message;
            if (!event.error_code.empty()) text = event.error_code + ": " + text;
            log_error("converter", "Runtime error: " + text);
            out.push_back(Chunk::error(text));
            out.push_back(Chunk::terminal());
            end_turn(true, turn_chunks_ + out.size());
            return out;
        }
        case RuntimeEventKind::UsageMetadata:
            // Applies to the finish of the current (or next) turn
            usage_ = event.usage;
            has_usage_ = true;
            break;
        case RuntimeEventKind::Unknown:
            log_debug("converter", "Ignoring unknown event kind: " + event.raw_kind);
            break;
    }

    if (active_) turn_chunks_ += out.size();
    return out;
}

std::vector<Chunk> StreamConverter::finish_turn() {
    std::vector<Chunk> out;
    if (!active_) return out;
    close_open_blocks(out);
    append_finish(out);
    end_turn(false, turn_chunks_ + out.size());
    return out;
}

std::vector<Chunk> StreamConverter::fail_turn(const std::string& error_text) {
    std::vector<Chunk> out;
    begin_turn(out);
    out.push_back(Chunk::error(error_text));
    out.push_back(Chunk::terminal());
    end_turn(true, turn_chunks_ + out.size());
    return out;
}

// ── Turn lifecycle ──────────────────────────────────────────────

void StreamConverter::begin_turn(std::vector<Chunk>& out) {
    if (active_) return;

    if (first_turn_ && !options_.message_id.empty()) {
        message_id_ = options_.message_id;
    } else {
        message_id_ = generate_uuid();
    }
    first_turn_ = false;
    active_ = true;
    turn_held_ = false;
    turn_chunks_ = 0;

    blocks_.clear();
    tool_calls_.clear();
    input_started_.clear();
    input_available_.clear();
    approval_requested_.clear();
    awaiting_approval_.clear();

    out.push_back(Chunk::start(message_id_));
    log_debug("converter", "Turn started: " + message_id_);

    TurnStartedEvent ev;
    ev.message_id = message_id_;
    publish_if(bus_, ev);
}

void StreamConverter::end_turn(bool errored, size_t chunk_count) {
    active_ = false;
    turn_held_ = false;
    turns_completed_++;
    turn_chunks_ = 0;

    finish_reason_.clear();
    model_version_.clear();
    has_usage_ = false;
    usage_ = Usage{};

    log_debug("converter", "Turn finished: " + message_id_ + " (" +
                           std::to_string(chunk_count) + " chunks)");

    TurnFinishedEvent ev;
    ev.message_id = message_id_;
    ev.errored = errored;
    ev.chunk_count = chunk_count;
    publish_if(bus_, ev);
}

void StreamConverter::close_open_blocks(std::vector<Chunk>& out) {
    for (auto& block : blocks_) {
        if (!block.finished) {
            out.push_back(Chunk::text_end(block.id));
            block.finished = true;
        }
    }
}

void StreamConverter::append_finish(std::vector<Chunk>& out) {
    nlohmann::json metadata = nlohmann::json::object();
    if (has_usage_) {
        metadata["usage"] = {
            {"promptTokens", usage_.prompt_tokens},
            {"completionTokens", usage_.completion_tokens},
            {"totalTokens", usage_.total_tokens}
        };
    }
    const std::string& model = model_version_.empty() ? options_.agent_model : model_version_;
    if (!model.empty()) metadata["modelVersion"] = model;

    out.push_back(Chunk::finish(map_finish_reason(finish_reason_), metadata));
    out.push_back(Chunk::terminal());
}

// ── Text ────────────────────────────────────────────────────────

TextBlock* StreamConverter::open_block(TextChannel channel) {
    for (auto& block : blocks_) {
        if (block.channel == channel && !block.finished) return &block;
    }
    return nullptr;
}

void StreamConverter::on_text(const RuntimeEvent& event, std::vector<Chunk>& out) {
    TextBlock* block = open_block(event.channel);

    // Final output transcription repeats the whole block; close without re-emitting
    if (event.channel == TextChannel::Output && event.finished && block &&
        !block->text.empty() && event.text == block->text) {
        log_debug("converter", "Suppressing duplicate final transcription for " + block->id);
        out.push_back(Chunk::text_end(block->id));
        block->finished = true;
        return;
    }

    if (event.text.empty() && !block) return;

    if (!block) {
        TextBlock fresh;
        fresh.id = block_id(message_id_, event.channel);
        fresh.channel = event.channel;
        blocks_.push_back(std::move(fresh));
        block = &blocks_.back();
        out.push_back(Chunk::text_start(block->id));
    }

    if (!event.text.empty()) {
        out.push_back(Chunk::text_delta(block->id, event.text));
        block->text += event.text;
    }

    if (event.finished) {
        out.push_back(Chunk::text_end(block->id));
        block->finished = true;
    }
}

// ── Tool calls ──────────────────────────────────────────────────

ToolCallRecord* StreamConverter::find_call(const std::string& id) {
    auto it = std::find_if(tool_calls_.begin(), tool_calls_.end(),
                           [&](const ToolCallRecord& r) { return r.id == id; });
    return it == tool_calls_.end() ? nullptr : &*it;
}

ToolCallRecord& StreamConverter::record_call(const RuntimeEvent& event, bool internal) {
    ToolCallRecord* record = find_call(event.call_id);
    if (!record) {
        ToolCallRecord fresh;
        fresh.id = event.call_id;
        fresh.internal = internal;
        tool_calls_.push_back(std::move(fresh));
        record = &tool_calls_.back();
    }
    record->name = event.tool_name;
    if (event.has_args) {
        record->input = event.payload.is_null() ? nlohmann::json::object() : event.payload;
    }
    return *record;
}

void StreamConverter::on_function_call(const RuntimeEvent& event, std::vector<Chunk>& out) {
    if (event.tool_name == options_.confirmation_tool) {
        on_confirmation_call(event, out);
        return;
    }
    if (event.call_id.empty()) {
        log_warn("converter", "Function call without id for tool " + event.tool_name + ", skipping");
        return;
    }

    ToolCallRecord& record = record_call(event, false);

    if (input_started_.insert(record.id).second) {
        out.push_back(Chunk::tool_input_start(record.id, record.name));
    }
    if (event.has_args && input_available_.insert(record.id).second) {
        out.push_back(Chunk::tool_input_available(record.id, record.name, record.input));
        record.state = ToolCallState::InputAvailable;
    }
}

void StreamConverter::on_confirmation_call(const RuntimeEvent& event, std::vector<Chunk>& out) {
    if (event.call_id.empty()) {
        log_error("converter", "Confirmation call without id, cannot create approval request");
        return;
    }

    ToolCallRecord& record = record_call(event, true);

    // The original call's id lives in the arguments; wait for them
    if (!event.has_args) return;
    if (approval_requested_.count(record.id)) return;

    std::string original_id = record.id;
    const auto& args = record.input;
    if (args.is_object() && args.contains("originalFunctionCall") &&
        args["originalFunctionCall"].is_object()) {
        const auto& original = args["originalFunctionCall"];
        if (original.contains("id") && original["id"].is_string()) {
            original_id = original["id"].get<std::string>();
        }
    }
    record.original_call_id = original_id;

    approval_requested_.insert(record.id);
    awaiting_approval_.insert(original_id);
    out.push_back(Chunk::tool_approval_request(original_id, record.id));
    log_info("converter", "Approval requested for " + original_id + " (approval " + record.id + ")");
}

void StreamConverter::on_function_response(const RuntimeEvent& event, std::vector<Chunk>& out) {
    if (event.tool_name.empty()) {
        log_warn("converter", "Function response without tool name, skipping");
        return;
    }

    if (event.tool_name == options_.confirmation_tool) {
        ToolCallRecord* record = find_call(event.call_id);
        if (record) {
            record->response = event.payload;
            // No original call to wait for when the request fell back to its own id
            if (record->original_call_id == record->id) awaiting_approval_.erase(record->id);
        }
        log_debug("converter", "Confirmation response for " + event.call_id + " kept internal");
        return;
    }

    ToolResult result = tool_result_from_response(event.payload);
    bool is_error = !result.success;
    const std::string& error_text = result.output;

    if (is_error && error_text == kConfirmationRequiredMessage) {
        log_info("converter", "Suppressing confirmation-required response for " + event.tool_name);
        return;
    }

    awaiting_approval_.erase(event.call_id);
    ToolCallRecord* record = find_call(event.call_id);

    if (is_error) {
        log_warn("converter", "Tool " + event.tool_name + " failed: " + error_text);
        out.push_back(Chunk::tool_output_error(event.call_id, error_text));
        if (record) record->state = ToolCallState::OutputError;
    } else {
        out.push_back(Chunk::tool_output_available(event.call_id, event.payload));
        if (record) record->state = ToolCallState::OutputAvailable;
    }
}

// ── Turn completion ─────────────────────────────────────────────

void StreamConverter::on_turn_complete(const RuntimeEvent& event, std::vector<Chunk>& out) {
    if (!active_) {
        log_debug("converter", "Turn complete while idle, ignoring");
        return;
    }
    if (!event.finish_reason.empty()) finish_reason_ = event.finish_reason;
    if (!event.model_version.empty()) model_version_ = event.model_version;

    if (options_.hold_turn_while_awaiting_approval && !awaiting_approval_.empty()) {
        turn_held_ = true;
        log_info("converter", "Holding turn " + message_id_ + ", " +
                              std::to_string(awaiting_approval_.size()) +
                              " call(s) awaiting approval");
        return;
    }

    turn_held_ = false;
    close_open_blocks(out);
    append_finish(out);
    end_turn(false, turn_chunks_ + out.size());
}

} // namespace streamgate
