#include "approval_registry.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "util.hpp"
#include <algorithm>

namespace streamgate {

ApprovalRegistry::ApprovalRegistry(EventBus* bus) : bus_(bus) {}

ApprovalRegistry::~ApprovalRegistry() = default;

void ApprovalRegistry::register_request(const std::string& id, const std::string& name,
                                        const nlohmann::json& args) {
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it != slots_.end()) {
            std::lock_guard<std::mutex> slot_lock(it->second->mutex);
            it->second->request.name = name;
            it->second->request.args = args;
            replaced = true;
        } else {
            auto slot = std::make_shared<Slot>();
            slot->request.id = id;
            slot->request.name = name;
            slot->request.args = args;
            slot->request.created_at_ms = epoch_millis();
            slots_.emplace(id, std::move(slot));
        }
    }

    if (replaced) {
        log_warn("approval", "Request " + id + " already pending, replacing its metadata");
        return;
    }
    log_info("approval", "Approval pending for " + name + " (id=" + id + ")");

    ApprovalRequestedEvent ev;
    ev.request_id = id;
    ev.name = name;
    publish_if(bus_, ev);
}

std::shared_ptr<ApprovalRegistry::Slot> ApprovalRegistry::find_or_insert(const std::string& id,
                                                                         bool& inserted) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it != slots_.end()) {
        inserted = false;
        return it->second;
    }
    auto slot = std::make_shared<Slot>();
    slot->request.id = id;
    slot->request.created_at_ms = epoch_millis();
    slots_.emplace(id, slot);
    inserted = true;
    return slot;
}

void ApprovalRegistry::erase_if_same(const std::string& id, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
}

ApprovalOutcome ApprovalRegistry::await_decision(const std::string& id,
                                                 std::chrono::milliseconds timeout) {
    bool inserted = false;
    auto slot = find_or_insert(id, inserted);
    if (inserted) {
        log_warn("approval", "Awaiting unregistered request " + id + ", registering it");
    }

    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;

    std::optional<ApprovalDecision> received;
    bool woke = false;
    {
        std::unique_lock<std::mutex> lock(slot->mutex);
        woke = slot->cv.wait_until(lock, deadline, [&] {
            return slot->decision.has_value() || slot->settled;
        });
        if (woke && slot->decision) {
            received = std::move(slot->decision);
            slot->decision.reset();
        }
        if (woke) slot->settled = true;
    }

    if (woke) {
        erase_if_same(id, slot);
    } else {
        // Settle under the map lock: a concurrent resolve either landed
        // before this point or will find the request gone.
        std::lock_guard<std::mutex> lock(mutex_);
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->decision) {
            received = std::move(slot->decision);
            slot->decision.reset();
        }
        slot->settled = true;
        auto it = slots_.find(id);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
    }

    ApprovalOutcome outcome;
    if (received) {
        outcome.decision = *received;
        if (outcome.decision.approved) {
            log_info("approval", "Request " + id + " approved");
        } else {
            log_info("approval", "Request " + id + " denied" +
                                 (outcome.decision.reason.empty() ? std::string()
                                                                  : ": " + outcome.decision.reason));
        }
        return outcome;
    }

    if (woke) {
        outcome.decision.reason = "Approval request " + id + " was cancelled";
        log_info("approval", "Request " + id + " cancelled while waiting");
        return outcome;
    }

    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    outcome.timed_out = true;
    outcome.decision.reason = "Approval timeout after " + std::to_string(timeout.count()) + "ms";
    log_warn("approval", "Approval timeout for " + id + " after " +
                         std::to_string(waited.count()) + "ms, treating as denied");

    ApprovalTimedOutEvent ev;
    ev.request_id = id;
    ev.waited_ms = static_cast<uint64_t>(waited.count());
    publish_if(bus_, ev);
    return outcome;
}

bool ApprovalRegistry::resolve(const std::string& id, const ApprovalDecision& decision) {
    std::shared_ptr<Slot> slot;
    bool delivered = false;
    bool overwrote = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it != slots_.end()) {
            slot = it->second;
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            if (!slot->settled) {
                overwrote = slot->decision.has_value();
                slot->decision = decision;
                delivered = true;
            }
        }
    }

    if (!slot) {
        log_warn("approval", "Resolve for unknown request " + id + ", ignoring");
        return false;
    }
    if (!delivered) {
        log_warn("approval", "Request " + id + " already settled, ignoring decision");
        return false;
    }
    if (overwrote) {
        log_debug("approval", "Replacing buffered decision for " + id);
    }
    slot->cv.notify_all();

    ApprovalResolvedEvent ev;
    ev.request_id = id;
    ev.approved = decision.approved;
    ev.reason = decision.reason;
    publish_if(bus_, ev);
    return true;
}

size_t ApprovalRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

std::vector<PendingApprovalRequest> ApprovalRegistry::pending_requests() const {
    std::vector<PendingApprovalRequest> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            out.push_back(slot->request);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const PendingApprovalRequest& a, const PendingApprovalRequest& b) {
                  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
                  return a.id < b.id;
              });
    return out;
}

void ApprovalRegistry::clear() {
    std::vector<std::shared_ptr<Slot>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : slots_) {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            slot->settled = true;
            slot->decision.reset();
            dropped.push_back(slot);
        }
        slots_.clear();
    }
    for (auto& slot : dropped) {
        slot->cv.notify_all();
    }
    if (!dropped.empty()) {
        log_info("approval", "Cleared " + std::to_string(dropped.size()) + " pending request(s)");
    }
}

} // namespace streamgate
