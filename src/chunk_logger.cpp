#include "chunk_logger.hpp"
#include "log.hpp"
#include "util.hpp"
#include <ctime>
#include <filesystem>
#include <system_error>

namespace streamgate {

std::string ChunkLogger::generate_session_id() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d-%H%M%S", &tm_buf);
    return std::string("session-") + buf;
}

ChunkLogger::ChunkLogger(const ChunkLogConfig& config)
    : enabled_(config.enabled),
      output_dir_(config.output_dir),
      session_id_(config.session_id.empty() ? generate_session_id() : config.session_id) {
    if (!enabled_) return;

    std::error_code ec;
    std::filesystem::create_directories(output_path(), ec);
    if (ec) {
        log_error("chunk_log", "Cannot create " + output_path() + ": " + ec.message() +
                               ", disabling chunk logging");
        enabled_ = false;
        return;
    }
    log_info("chunk_log", "Recording chunks to " + output_path());
}

ChunkLogger::~ChunkLogger() {
    close();
}

std::string ChunkLogger::output_path() const {
    return (std::filesystem::path(output_dir_) / session_id_).string();
}

std::ofstream& ChunkLogger::stream_for(const std::string& location) {
    auto it = files_.find(location);
    if (it != files_.end()) return *it->second;

    auto path = std::filesystem::path(output_path()) / (location + ".jsonl");
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        log_warn("chunk_log", "Cannot open " + path.string());
    }
    return *files_.emplace(location, std::move(file)).first->second;
}

void ChunkLogger::log_chunk(const std::string& location, const std::string& direction,
                            const nlohmann::json& chunk, const std::string& mode,
                            const nlohmann::json& metadata) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t seq = ++sequence_[location];

    nlohmann::json entry = {
        {"timestamp", epoch_millis()},
        {"session_id", session_id_},
        {"mode", mode},
        {"location", location},
        {"direction", direction},
        {"sequence_number", seq},
        {"chunk", chunk}
    };
    if (!metadata.is_null()) entry["metadata"] = metadata;

    std::ofstream& out = stream_for(location);
    if (!out.is_open()) return;
    out << entry.dump() << "\n";
    out.flush();
}

nlohmann::json ChunkLogger::info() const {
    return {
        {"enabled", enabled_},
        {"output_dir", output_dir_},
        {"session_id", session_id_},
        {"output_path", output_path()}
    };
}

void ChunkLogger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [location, file] : files_) {
        file->close();
    }
    files_.clear();
}

} // namespace streamgate
