#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace streamgate {

class EventBus;

struct PendingApprovalRequest {
    std::string id;
    std::string name;                                  // display only
    nlohmann::json args = nlohmann::json::object();    // display only
    uint64_t created_at_ms = 0;
};

struct ApprovalDecision {
    bool approved = false;
    std::string reason;
};

// A timeout is reported as a denial; timed_out tells the caller why.
struct ApprovalOutcome {
    ApprovalDecision decision;
    bool timed_out = false;
};

// Keyed rendezvous between a suspended tool execution and whoever supplies
// the human decision. Each request id has its own slot (mutex + condition
// variable); the map lock is only held to find or remove a slot, so waits on
// unrelated ids never serialize.
class ApprovalRegistry {
public:
    explicit ApprovalRegistry(EventBus* bus = nullptr);
    ~ApprovalRegistry();

    ApprovalRegistry(const ApprovalRegistry&) = delete;
    ApprovalRegistry& operator=(const ApprovalRegistry&) = delete;

    // Make a request visible. Registering an id that is already pending
    // replaces its display metadata and logs a warning.
    void register_request(const std::string& id, const std::string& name,
                          const nlohmann::json& args = nlohmann::json::object());

    // Block the calling thread until a decision for id arrives or timeout
    // elapses. Either way the request is removed. An id that was never
    // registered is registered implicitly.
    ApprovalOutcome await_decision(const std::string& id, std::chrono::milliseconds timeout);

    // Deliver a decision. Buffered when nobody is waiting yet; consumed at
    // most once. Returns false (logged no-op) for an unknown or already
    // settled id.
    bool resolve(const std::string& id, const ApprovalDecision& decision);

    size_t pending_count() const;
    std::vector<PendingApprovalRequest> pending_requests() const;

    // Drop every request. Waiters wake up with a denial.
    void clear();

private:
    struct Slot {
        std::mutex mutex;
        std::condition_variable cv;
        PendingApprovalRequest request;
        std::optional<ApprovalDecision> decision;
        bool settled = false;   // consumed, timed out or cleared
    };

    std::shared_ptr<Slot> find_or_insert(const std::string& id, bool& inserted);
    void erase_if_same(const std::string& id, const std::shared_ptr<Slot>& slot);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    EventBus* bus_;
};

} // namespace streamgate
