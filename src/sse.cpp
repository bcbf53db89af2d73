#include "sse.hpp"

namespace streamgate {

bool SSEParser::dispatch(const SSECallback& callback) {
    bool keep_going = true;
    if (has_data_) {
        SSEEvent event{current_event_, current_data_};
        keep_going = callback(event);
    }
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
    return keep_going;
}

void SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            // Incomplete line - keep remainder in buffer
            buffer_ = buffer_.substr(pos);
            return;
        }

        std::string line = buffer_.substr(pos, newline - pos);
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (!dispatch(callback)) {
                buffer_ = buffer_.substr(pos);
                return;
            }
        } else if (line.rfind("event:", 0) == 0) {
            current_event_ = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (has_data_) {
                current_data_ += '\n';
            }
            // Handle both "data: payload" (with space) and "data:payload" (without)
            current_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
            has_data_ = true;
        }
        // Ignore other lines (comments starting with :, id:, retry:)
    }

    // All data processed
    buffer_.clear();
}

void SSEParser::flush(const SSECallback& callback) {
    if (!buffer_.empty()) {
        // Terminate the dangling line so it is parsed as a full line
        std::string rest = buffer_;
        buffer_.clear();
        feed(rest + "\n", callback);
    }
    dispatch(callback);
}

void SSEParser::reset() {
    buffer_.clear();
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
}

} // namespace streamgate
