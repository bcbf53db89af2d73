#include "turn_streamer.hpp"
#include "stream_converter.hpp"
#include "chunk_logger.hpp"
#include "approval_gate.hpp"
#include "log.hpp"
#include "util.hpp"
#include <exception>
#include <stdexcept>

namespace streamgate {

std::optional<RuntimeEvent> JsonLinesEventSource::next() {
    std::string line;
    while (std::getline(in_, line)) {
        line_number_++;
        if (trim(line).empty()) continue;
        try {
            return decode_runtime_event_line(line);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("line " + std::to_string(line_number_) + ": " + e.what());
        }
    }
    return std::nullopt;
}

bool SseStreamWriter::write(const Chunk& chunk) {
    out_ << format_sse(chunk);
    out_.flush();
    return out_.good();
}

TurnStreamer::TurnStreamer(StreamConverter& converter, ChunkLogger* chunk_log,
                           ApprovalRouter* router)
    : converter_(converter), chunk_log_(chunk_log), router_(router) {}

bool TurnStreamer::emit(const std::vector<Chunk>& chunks, ChunkWriter& writer,
                        StreamStats& stats) {
    for (const auto& chunk : chunks) {
        if (router_) router_->observe(chunk);
        if (chunk_log_) chunk_log_->log_chunk("sse-event", "out", chunk.to_json());

        if (!writer.write(chunk)) {
            log_warn("stream", "Client connection closed, stopping");
            stats.client_closed = true;
            return false;
        }
        stats.chunks++;
        if (chunk.is_terminal()) stats.turns++;
    }
    return true;
}

StreamStats TurnStreamer::run(RuntimeEventSource& source, ChunkWriter& writer) {
    StreamStats stats;

    while (true) {
        std::optional<RuntimeEvent> event;
        try {
            event = source.next();
        } catch (const std::exception& e) {
            log_error("stream", std::string("Runtime event stream failed: ") + e.what());
            stats.source_failed = true;
            emit(converter_.fail_turn(e.what()), writer, stats);
            return stats;
        }
        if (!event) break;

        stats.events++;
        if (chunk_log_) {
            chunk_log_->log_chunk("runtime-event", "in", encode_runtime_event(*event));
        }
        if (!emit(converter_.convert(*event), writer, stats)) return stats;
    }

    if (converter_.active()) {
        log_debug("stream", "Source ended with an open turn, finishing it");
        emit(converter_.finish_turn(), writer, stats);
    }

    log_debug("stream", "Stream done: " + std::to_string(stats.events) + " events, " +
                        std::to_string(stats.chunks) + " chunks, " +
                        std::to_string(stats.turns) + " turns");
    return stats;
}

} // namespace streamgate
