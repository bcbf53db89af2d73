#pragma once
#include "config.hpp"
#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace streamgate {

// Records chunks at named points of the data flow as JSONL, one file per
// location under <output_dir>/<session_id>/. Disabled loggers do nothing.
class ChunkLogger {
public:
    explicit ChunkLogger(const ChunkLogConfig& config);
    ~ChunkLogger();

    ChunkLogger(const ChunkLogger&) = delete;
    ChunkLogger& operator=(const ChunkLogger&) = delete;

    bool enabled() const { return enabled_; }
    const std::string& session_id() const { return session_id_; }
    std::string output_path() const;

    // location: e.g. "runtime-event", "sse-event"; direction: "in" or "out"
    void log_chunk(const std::string& location, const std::string& direction,
                   const nlohmann::json& chunk, const std::string& mode = "sse",
                   const nlohmann::json& metadata = nullptr);

    nlohmann::json info() const;

    void close();

    // "session-YYYY-MM-DD-HHMMSS" (UTC)
    static std::string generate_session_id();

private:
    std::ofstream& stream_for(const std::string& location);

    bool enabled_;
    std::string output_dir_;
    std::string session_id_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> sequence_;
    std::unordered_map<std::string, std::unique_ptr<std::ofstream>> files_;
};

} // namespace streamgate
