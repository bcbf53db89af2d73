#pragma once
#include "approval_registry.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <future>
#include <optional>
#include <unordered_map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace streamgate {

class EventBus;

// One conversation-history entry recorded in a session.
struct TurnRecord {
    std::string id;        // replayed turns: "sync_<index>_<role>"
    std::string role;
    std::string text;
    uint64_t timestamp = 0;
};

// Logical session for one (subject, connection) identity. Shared between the
// transport that owns the connection and the tool executions it spawns, so
// every accessor is thread-safe.
class Session {
public:
    Session(std::string id, std::string subject, std::string signature,
            std::shared_ptr<ApprovalRegistry> approvals);

    const std::string& id() const { return id_; }
    const std::string& subject() const { return subject_; }
    const std::string& signature() const { return signature_; }

    ApprovalRegistry& approvals() { return *approvals_; }

    size_t replayed_count() const;
    void set_replayed_count(size_t count);

    void append_turn(TurnRecord turn);
    std::vector<TurnRecord> turns() const;
    size_t turn_count() const;

    // Free-form state map
    void set_state(const std::string& key, const nlohmann::json& value);
    std::optional<nlohmann::json> get_state(const std::string& key) const;
    bool erase_state(const std::string& key);
    nlohmann::json state_snapshot() const;

    // Held for the duration of one history replay
    std::mutex& replay_mutex() { return replay_mutex_; }

private:
    std::string id_;
    std::string subject_;
    std::string signature_;
    std::shared_ptr<ApprovalRegistry> approvals_;

    mutable std::mutex mutex_;
    size_t replayed_count_ = 0;
    std::vector<TurnRecord> turns_;
    nlohmann::json state_ = nlohmann::json::object();

    std::mutex replay_mutex_;
};

// ── Backend ─────────────────────────────────────────────────────

struct SessionKey {
    std::string app_name;
    std::string user_id;
    std::string session_id;
};

enum class CreateStatus { Created, AlreadyExists, Failed };

const char* create_status_to_string(CreateStatus status);

struct BackendCreateResult {
    CreateStatus status = CreateStatus::Failed;
    std::string error;
};

// Where sessions live downstream (the agent runtime's session service).
// Creation may be slow; the store guarantees one create per identity.
class SessionBackend {
public:
    virtual ~SessionBackend() = default;
    virtual BackendCreateResult create_session(const SessionKey& key) = 0;
    virtual bool session_exists(const SessionKey& key) = 0;
};

class InMemorySessionBackend : public SessionBackend {
public:
    BackendCreateResult create_session(const SessionKey& key) override;
    bool session_exists(const SessionKey& key) override;

    // Seed a session as if another process had created it
    void preload(const SessionKey& key);

    size_t create_calls() const;
    size_t size() const;

private:
    static std::string key_string(const SessionKey& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionKey> sessions_;
    size_t create_calls_ = 0;
};

// ── Store ───────────────────────────────────────────────────────

enum class SessionOrigin { Cached, Created, Fetched };

const char* session_origin_to_string(SessionOrigin origin);

struct GetOrCreateResult {
    std::shared_ptr<Session> session;   // null on failure
    SessionOrigin origin = SessionOrigin::Cached;
    std::string error;

    bool ok() const { return session != nullptr; }
};

class SessionStore {
public:
    // With no shared registry, every session gets its own ApprovalRegistry.
    SessionStore(std::shared_ptr<SessionBackend> backend, SessionConfig config = {},
                 EventBus* bus = nullptr,
                 std::shared_ptr<ApprovalRegistry> shared_approvals = nullptr);

    // Concurrent calls for one identity share a single backend create.
    GetOrCreateResult get_or_create(const std::string& subject,
                                    const std::string& signature = "");

    std::shared_ptr<Session> find(const std::string& session_id) const;

    std::string session_id_for(const std::string& subject, const std::string& signature) const;

    size_t size() const;
    std::vector<std::string> list_sessions() const;

    // Drop every cached session (tests and ops). Backend is untouched.
    void clear();

private:
    GetOrCreateResult create(const std::string& session_id, const std::string& subject,
                             const std::string& signature);

    std::shared_ptr<SessionBackend> backend_;
    SessionConfig config_;
    EventBus* bus_;
    std::shared_ptr<ApprovalRegistry> shared_approvals_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, std::shared_future<GetOrCreateResult>> in_flight_;
};

} // namespace streamgate
