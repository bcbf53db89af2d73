#include "event_bus.hpp"
#include "log.hpp"
#include <exception>

namespace streamgate {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

uint64_t EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    catch_all_.push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [tag, subs] : handlers_) {
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id == id) {
                subs.erase(it);
                return true;
            }
        }
    }
    for (auto it = catch_all_.begin(); it != catch_all_.end(); ++it) {
        if (it->id == id) {
            catch_all_.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const Event& event) {
    // Copy handlers out under lock, then call without lock held.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it != handlers_.end()) {
            to_call.reserve(it->second.size() + catch_all_.size());
            for (const auto& sub : it->second) {
                to_call.push_back(sub.handler);
            }
        }
        for (const auto& sub : catch_all_) {
            to_call.push_back(sub.handler);
        }
    }
    for (const auto& handler : to_call) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            log_error("event_bus", std::string("Handler for ") + event.type_tag +
                                   " threw: " + e.what());
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    catch_all_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace streamgate
