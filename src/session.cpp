#include "session.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "util.hpp"
#include <algorithm>
#include <exception>

namespace streamgate {

// ── Session ─────────────────────────────────────────────────────

Session::Session(std::string id, std::string subject, std::string signature,
                 std::shared_ptr<ApprovalRegistry> approvals)
    : id_(std::move(id)), subject_(std::move(subject)), signature_(std::move(signature)),
      approvals_(std::move(approvals)) {}

size_t Session::replayed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replayed_count_;
}

void Session::set_replayed_count(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    replayed_count_ = count;
}

void Session::append_turn(TurnRecord turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.push_back(std::move(turn));
}

std::vector<TurnRecord> Session::turns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_;
}

size_t Session::turn_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

void Session::set_state(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_[key] = value;
}

std::optional<nlohmann::json> Session::get_state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(key);
    if (it == state_.end()) return std::nullopt;
    return *it;
}

bool Session::erase_state(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.erase(key) > 0;
}

nlohmann::json Session::state_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

// ── InMemorySessionBackend ──────────────────────────────────────

const char* create_status_to_string(CreateStatus status) {
    switch (status) {
        case CreateStatus::Created: return "created";
        case CreateStatus::AlreadyExists: return "already-exists";
        case CreateStatus::Failed: return "failed";
    }
    return "failed";
}

std::string InMemorySessionBackend::key_string(const SessionKey& key) {
    return key.app_name + "/" + key.user_id + "/" + key.session_id;
}

BackendCreateResult InMemorySessionBackend::create_session(const SessionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    create_calls_++;
    auto inserted = sessions_.emplace(key_string(key), key).second;
    if (!inserted) {
        return BackendCreateResult{CreateStatus::AlreadyExists,
                                   "Session " + key.session_id + " already exists"};
    }
    return BackendCreateResult{CreateStatus::Created, ""};
}

bool InMemorySessionBackend::session_exists(const SessionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(key_string(key)) > 0;
}

void InMemorySessionBackend::preload(const SessionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(key_string(key), key);
}

size_t InMemorySessionBackend::create_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return create_calls_;
}

size_t InMemorySessionBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// ── SessionStore ────────────────────────────────────────────────

const char* session_origin_to_string(SessionOrigin origin) {
    switch (origin) {
        case SessionOrigin::Cached: return "cached";
        case SessionOrigin::Created: return "created";
        case SessionOrigin::Fetched: return "fetched";
    }
    return "cached";
}

SessionStore::SessionStore(std::shared_ptr<SessionBackend> backend, SessionConfig config,
                           EventBus* bus, std::shared_ptr<ApprovalRegistry> shared_approvals)
    : backend_(std::move(backend)), config_(std::move(config)), bus_(bus),
      shared_approvals_(std::move(shared_approvals)) {}

std::string SessionStore::session_id_for(const std::string& subject,
                                         const std::string& signature) const {
    if (!signature.empty()) return "session_" + subject + "_" + signature;
    return "session_" + subject + "_" + config_.app_name;
}

GetOrCreateResult SessionStore::get_or_create(const std::string& subject,
                                              const std::string& signature) {
    std::string session_id = session_id_for(subject, signature);

    std::promise<GetOrCreateResult> promise;
    std::shared_future<GetOrCreateResult> joined;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            return GetOrCreateResult{it->second, SessionOrigin::Cached, ""};
        }
        auto pending = in_flight_.find(session_id);
        if (pending != in_flight_.end()) {
            joined = pending->second;
        } else {
            in_flight_.emplace(session_id, promise.get_future().share());
        }
    }
    // Another caller is creating this identity; wait for its result
    if (joined.valid()) return joined.get();

    GetOrCreateResult result = create(session_id, subject, signature);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.ok()) sessions_[session_id] = result.session;
        in_flight_.erase(session_id);
    }
    promise.set_value(result);

    if (result.ok()) {
        SessionCreatedEvent ev;
        ev.session_id = session_id;
        ev.subject = subject;
        ev.fetched_existing = result.origin == SessionOrigin::Fetched;
        publish_if(bus_, ev);
    }
    return result;
}

GetOrCreateResult SessionStore::create(const std::string& session_id, const std::string& subject,
                                       const std::string& signature) {
    SessionKey key{config_.app_name, subject, session_id};
    log_info("session", "Creating session " + session_id + " for " + subject +
                        (signature.empty() ? std::string() : ", connection " + signature));

    BackendCreateResult created;
    try {
        created = backend_->create_session(key);
    } catch (const std::exception& e) {
        created = BackendCreateResult{CreateStatus::Failed, e.what()};
    }

    SessionOrigin origin = SessionOrigin::Created;
    if (created.status == CreateStatus::AlreadyExists) {
        log_warn("session", "Session " + session_id + " already exists downstream, fetching it");
        bool exists = false;
        try {
            exists = backend_->session_exists(key);
        } catch (const std::exception& e) {
            created.error = e.what();
        }
        if (!exists) {
            std::string error = "Failed to fetch existing session " + session_id +
                                (created.error.empty() ? std::string() : ": " + created.error);
            log_error("session", error);
            return GetOrCreateResult{nullptr, SessionOrigin::Fetched, error};
        }
        origin = SessionOrigin::Fetched;
    } else if (created.status == CreateStatus::Failed) {
        std::string error = "Failed to create session " + session_id +
                            (created.error.empty() ? std::string() : ": " + created.error);
        log_error("session", error);
        return GetOrCreateResult{nullptr, SessionOrigin::Created, error};
    }

    auto approvals = shared_approvals_ ? shared_approvals_
                                       : std::make_shared<ApprovalRegistry>(bus_);
    auto session = std::make_shared<Session>(session_id, subject, signature, std::move(approvals));
    return GetOrCreateResult{std::move(session), origin, ""};
}

std::shared_ptr<Session> SessionStore::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void SessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_info("session", "Cleared " + std::to_string(sessions_.size()) + " session(s)");
    sessions_.clear();
}

} // namespace streamgate
