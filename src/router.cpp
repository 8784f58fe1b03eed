#include "toolwire/router.hpp"
#include "toolwire/error.hpp"
#include "toolwire/log.hpp"

namespace toolwire {

Router::Router(std::shared_ptr<spdlog::logger> logger)
    : logger_(log::or_default(std::move(logger))) {
}

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::require_state(const std::string& method, SessionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_requirements_[method] = state;
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg,
                                                const Session& session) {
    const SessionState state = session.state();
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return dispatch_request(*req, state);
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        dispatch_notification(*notif, state);
        return std::nullopt;
    }
    // The server sends no requests, so nothing is waiting for a response.
    const auto& resp = std::get<JsonRpcResponse>(msg);
    logger_->warn("Ignoring unexpected response (id {})",
                  resp.id ? to_string(*resp.id) : std::string("null"));
    return std::nullopt;
}

std::optional<JsonRpcResponse> Router::dispatch_request(const JsonRpcRequest& req,
                                                        SessionState state) {
    if (state == SessionState::ShuttingDown) {
        return make_error(req.id, JsonRpcError{error::ConnectionClosing,
                                               "Connection closing", std::nullopt});
    }

    // Hold the lock only for the lookup; handlers may call back into the router.
    RequestHandler handler;
    SessionState required = SessionState::Ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto req_it = state_requirements_.find(req.method);
        if (req_it != state_requirements_.end()) required = req_it->second;
        auto it = request_handlers_.find(req.method);
        if (it != request_handlers_.end()) handler = it->second;
    }

    if (state != required) {
        logger_->warn("Rejecting '{}' in state {}", req.method, to_string(state));
        std::string message = required == SessionState::NotConnected
            ? "Session already initialized"
            : "Session not initialized";
        return make_error(req.id, JsonRpcError{error::InvalidRequest, std::move(message),
                                               std::nullopt});
    }
    if (!handler) {
        return make_error(req.id, JsonRpcError{error::MethodNotFound,
                                               "Method not found: " + req.method,
                                               std::nullopt});
    }

    try {
        auto result = handler(req);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            return make_result(req.id, std::move(*ok));
        }
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            return make_error(req.id, std::move(*err));
        }
        return std::nullopt;
    } catch (const McpProtocolError& e) {
        return make_error(req.id, JsonRpcError{e.code, e.what(), e.data});
    } catch (const std::exception& e) {
        logger_->error("Handler for '{}' (id {}) failed: {}", req.method, to_string(req.id),
                       e.what());
        return make_error(req.id, JsonRpcError{error::InternalError, "Internal error",
                                               std::nullopt});
    }
}

void Router::dispatch_notification(const JsonRpcNotification& notif, SessionState state) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            logger_->debug("Ignoring unknown notification '{}'", notif.method);
            return;
        }
        auto req_it = state_requirements_.find(notif.method);
        if (req_it != state_requirements_.end() && req_it->second != state) {
            logger_->warn("Ignoring '{}' in state {}", notif.method, to_string(state));
            return;
        }
        handler = it->second;
    }

    nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();
    try {
        handler(params);
    } catch (const std::exception& e) {
        // Notifications have no reply channel.
        logger_->warn("Notification '{}' failed: {}", notif.method, e.what());
    }
}

} // namespace toolwire
