#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace streamgate {

class EventBus;
class Session;

struct HistoryMessage {
    std::string role;   // "user", "assistant", "system"
    std::string text;
};

// Decode UI messages: [{role, content?, parts?: [{type: "text", text}]}].
// Text parts are joined; content is used when there are none. Throws
// std::invalid_argument when the value is not an array of objects with a
// string role.
std::vector<HistoryMessage> history_from_json(const nlohmann::json& messages);

// Seeds a session with the conversation turns it has not seen yet. The last
// message is the new, unanswered one and is never replayed.
class HistoryReplicator {
public:
    explicit HistoryReplicator(EventBus* bus = nullptr) : bus_(bus) {}

    // Returns the number of turns appended (0 when nothing is new).
    size_t replay(Session& session, const std::vector<HistoryMessage>& messages);

    static std::string turn_id(size_t index, const std::string& role);

private:
    EventBus* bus_;
};

} // namespace streamgate
