#pragma once
#include "json_rpc.hpp"
#include "session.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <spdlog/spdlog.h>

namespace toolwire {

/// Returned by a request handler that has taken over the reply; the
/// response is sent later by whoever owns the call.
struct Deferred {};

using HandlerResult = std::variant<nlohmann::json, JsonRpcError, Deferred>;
using RequestHandler = std::function<HandlerResult(const JsonRpcRequest& request)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method name -> handler table with session state gating.
class Router {
public:
    explicit Router(std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Register a request handler. Requests need SessionState::Ready unless
    /// require_state() says otherwise.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler. Notifications are accepted in any
    /// state unless require_state() names one.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Restrict a method to one session state.
    void require_state(const std::string& method, SessionState state);

    /// Route one incoming message. Returns the response to send, or nullopt
    /// for notifications, incoming responses and deferred requests.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg,
                                                          const Session& session);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::optional<JsonRpcResponse> dispatch_request(const JsonRpcRequest& req,
                                                    SessionState state);
    void dispatch_notification(const JsonRpcNotification& notif, SessionState state);

    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::unordered_map<std::string, SessionState> state_requirements_;
};

} // namespace toolwire
