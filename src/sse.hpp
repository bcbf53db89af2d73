#pragma once
#include <string>
#include <functional>

namespace streamgate {

struct SSEEvent {
    std::string event; // event type, empty for plain "data:" frames
    std::string data;  // raw payload (JSON or the terminal marker)
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental parser: frames may be split across any number of feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events
    void feed(const std::string& chunk, const SSECallback& callback);

    // Dispatch a trailing frame that was not followed by a blank line
    void flush(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    bool dispatch(const SSECallback& callback);

    std::string buffer_;
    std::string current_event_;
    std::string current_data_;
    bool has_data_ = false;
};

} // namespace streamgate
