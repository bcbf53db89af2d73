#include "history_replicator.hpp"
#include "session.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "util.hpp"
#include <stdexcept>

namespace streamgate {

std::vector<HistoryMessage> history_from_json(const nlohmann::json& messages) {
    if (!messages.is_array()) {
        throw std::invalid_argument("history must be a JSON array");
    }

    std::vector<HistoryMessage> out;
    out.reserve(messages.size());
    for (const auto& msg : messages) {
        if (!msg.is_object() || !msg.contains("role") || !msg["role"].is_string()) {
            throw std::invalid_argument("history message must be an object with a string role");
        }

        HistoryMessage m;
        m.role = msg["role"].get<std::string>();

        bool has_text_part = false;
        if (msg.contains("parts") && msg["parts"].is_array()) {
            for (const auto& part : msg["parts"]) {
                if (part.is_object() && part.value("type", "") == "text" &&
                    part.contains("text") && part["text"].is_string()) {
                    m.text += part["text"].get<std::string>();
                    has_text_part = true;
                }
            }
        }
        if (!has_text_part && msg.contains("content") && msg["content"].is_string()) {
            m.text = msg["content"].get<std::string>();
        }
        out.push_back(std::move(m));
    }
    return out;
}

std::string HistoryReplicator::turn_id(size_t index, const std::string& role) {
    return "sync_" + std::to_string(index) + "_" + role;
}

size_t HistoryReplicator::replay(Session& session, const std::vector<HistoryMessage>& messages) {
    // Concurrent replays of one session must not both see the old count
    std::lock_guard<std::mutex> lock(session.replay_mutex());

    size_t target = messages.empty() ? 0 : messages.size() - 1;
    size_t already = session.replayed_count();

    if (target <= already) {
        if (target < already) {
            log_debug("history", "Session " + session.id() + " already replayed " +
                                 std::to_string(already) + " message(s), got " +
                                 std::to_string(target) + "; nothing to do");
        }
        return 0;
    }

    uint64_t now = epoch_seconds();
    for (size_t i = already; i < target; ++i) {
        const auto& msg = messages[i];
        TurnRecord turn;
        turn.id = turn_id(i, msg.role);
        turn.role = msg.role;
        turn.text = msg.text;
        turn.timestamp = now;
        session.append_turn(std::move(turn));
        log_debug("history", "Replayed message " + std::to_string(i) + " role=" + msg.role);
    }
    session.set_replayed_count(target);

    size_t replayed = target - already;
    log_info("history", "Replayed " + std::to_string(replayed) + " message(s) into " +
                        session.id() + " (total " + std::to_string(target) + ")");

    HistoryReplayedEvent ev;
    ev.session_id = session.id();
    ev.replayed = replayed;
    ev.replayed_total = target;
    publish_if(bus_, ev);
    return replayed;
}

} // namespace streamgate
