#include "frontend_delegate.hpp"
#include "log.hpp"
#include <exception>
#include <stdexcept>

namespace streamgate {

FrontendToolDelegate::FrontendToolDelegate(std::chrono::milliseconds default_timeout)
    : default_timeout_(default_timeout) {}

FrontendToolDelegate::FrontendToolDelegate(const Config& config)
    : default_timeout_(std::chrono::milliseconds(config.tools.frontend_timeout_ms)) {}

ToolResult FrontendToolDelegate::execute_on_frontend(const std::string& tool_call_id,
                                                     const std::string& tool_name) {
    return execute_on_frontend(tool_call_id, tool_name, default_timeout_);
}

ToolResult FrontendToolDelegate::execute_on_frontend(const std::string& tool_call_id,
                                                     const std::string& tool_name,
                                                     std::chrono::milliseconds timeout) {
    std::future<nlohmann::json> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const std::string& key : {tool_call_id, kConfirmationIdPrefix + tool_call_id}) {
            auto cached = pre_resolved_.find(key);
            if (cached != pre_resolved_.end()) {
                nlohmann::json result = std::move(cached->second);
                pre_resolved_.erase(cached);
                log_debug("frontend", "Using pre-resolved result for " + tool_call_id);
                return tool_result_from_response(result);
            }
        }
        if (pending_.count(tool_call_id)) {
            log_warn("frontend", "Already waiting on client result for " + tool_call_id +
                                 ", rejecting duplicate " + tool_name);
            return ToolResult{false, "Frontend tool " + tool_name + " is already waiting on call " +
                                     tool_call_id};
        }
        std::promise<nlohmann::json> promise;
        future = promise.get_future();
        pending_.emplace(tool_call_id, std::move(promise));
    }

    log_debug("frontend", "Waiting for client result of " + tool_name + " (id=" + tool_call_id + ")");

    if (future.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        // Delivery and rejection settle the promise under this lock, so an
        // unsettled future means the pending entry is still ours
        if (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            pending_.erase(tool_call_id);
            log_warn("frontend", "Client result timeout for " + tool_name + " (id=" +
                                 tool_call_id + ")");
            return ToolResult{false, "Frontend tool " + tool_name + " timeout after " +
                                     std::to_string(timeout.count()) + "ms"};
        }
        // Delivered between the timeout and taking the lock; fall through
    }

    try {
        return tool_result_from_response(future.get());
    } catch (const std::runtime_error& e) {
        return ToolResult{false, e.what()};
    }
}

bool FrontendToolDelegate::submit_result(const std::string& tool_call_id,
                                         const nlohmann::json& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pending_.find(tool_call_id);
    if (it == pending_.end() && tool_call_id.rfind(kConfirmationIdPrefix, 0) == 0) {
        it = pending_.find(tool_call_id.substr(std::char_traits<char>::length(kConfirmationIdPrefix)));
    }
    if (it != pending_.end()) {
        it->second.set_value(result);
        pending_.erase(it);
        log_debug("frontend", "Delivered client result for " + tool_call_id);
        return true;
    }

    pre_resolved_[tool_call_id] = result;
    log_debug("frontend", "Cached early client result for " + tool_call_id);
    return true;
}

bool FrontendToolDelegate::reject(const std::string& tool_call_id,
                                  const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(tool_call_id);
    if (it == pending_.end()) return false;
    it->second.set_exception(std::make_exception_ptr(std::runtime_error(error_message)));
    pending_.erase(it);
    log_info("frontend", "Rejected client tool call " + tool_call_id + ": " + error_message);
    return true;
}

size_t FrontendToolDelegate::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t FrontendToolDelegate::cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pre_resolved_.size();
}

} // namespace streamgate
