#pragma once
#include "chunk.hpp"
#include "runtime_event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <ostream>

namespace streamgate {

class StreamConverter;
class ChunkLogger;
class ApprovalRouter;

// Pull side of the agent runtime.
class RuntimeEventSource {
public:
    virtual ~RuntimeEventSource() = default;
    // Next event, or nullopt once the runtime is done. Throws when the
    // underlying stream breaks.
    virtual std::optional<RuntimeEvent> next() = 0;
};

// Push side of the transport.
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;
    // Returns false once the client connection is gone.
    virtual bool write(const Chunk& chunk) = 0;
};

// One JSON runtime event per line; blank lines are skipped.
class JsonLinesEventSource : public RuntimeEventSource {
public:
    explicit JsonLinesEventSource(std::istream& in) : in_(in) {}
    std::optional<RuntimeEvent> next() override;
    size_t line_number() const { return line_number_; }

private:
    std::istream& in_;
    size_t line_number_ = 0;
};

// Writes SSE frames ("data: ...\n\n") to a byte stream.
class SseStreamWriter : public ChunkWriter {
public:
    explicit SseStreamWriter(std::ostream& out) : out_(out) {}
    bool write(const Chunk& chunk) override;

private:
    std::ostream& out_;
};

struct StreamStats {
    size_t events = 0;
    size_t chunks = 0;
    size_t turns = 0;          // terminal markers written
    bool client_closed = false;
    bool source_failed = false;
};

// Drives one connection: runtime events in, protocol chunks out.
class TurnStreamer {
public:
    explicit TurnStreamer(StreamConverter& converter, ChunkLogger* chunk_log = nullptr,
                          ApprovalRouter* router = nullptr);

    // Runs until the source is exhausted or the writer reports a closed
    // connection. A turn still open at the end is finished; a throwing
    // source ends the turn with an error chunk.
    StreamStats run(RuntimeEventSource& source, ChunkWriter& writer);

private:
    bool emit(const std::vector<Chunk>& chunks, ChunkWriter& writer, StreamStats& stats);

    StreamConverter& converter_;
    ChunkLogger* chunk_log_;
    ApprovalRouter* router_;
};

} // namespace streamgate
