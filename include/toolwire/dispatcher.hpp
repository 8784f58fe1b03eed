#pragma once
#include "error.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "session.hpp"
#include "types.hpp"
#include "version.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <spdlog/spdlog.h>

namespace toolwire {

/// A handler failure already mapped to the error the peer will see.
struct ToolFault {
    JsonRpcError error;
};

/// What a tool call produced, as seen at the dispatcher boundary.
using ToolOutcome = std::variant<CallToolResult, ToolFault>;

/// Protocol state machine for one session. Receives decoded messages on
/// the reader thread, answers lifecycle and listing requests inline, and
/// runs tool calls on a worker pool. Every request id is answered exactly
/// once: by its handler, its deadline, a cancellation (no answer) or the
/// shutdown drain, whichever comes first.
class Dispatcher {
public:
    struct Options {
        Implementation server_info{"toolwire", std::nullopt, std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        size_t worker_threads = 4;
        std::optional<std::chrono::milliseconds> call_timeout;  // per-tool timeouts win
        std::chrono::milliseconds shutdown_grace{5000};
        size_t page_size = 0;  // tools/list page size, 0 = no paging
        std::shared_ptr<spdlog::logger> logger;
    };

    /// Receives every outgoing message. Calls are serialized.
    using Sink = std::function<void(const JsonRpcMessage&)>;

    Dispatcher(Session& session, Sink sink, Options opts);

    /// Joins the worker pool; handlers still running are waited for.
    /// A handler that overruns its deadline keeps its thread, and the pool
    /// starts another worker in its place (up to WorkerPool::max_threads).
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Process one decoded message. Never throws.
    void handle(const JsonRpcMessage& msg);

    /// Answer input that could not be decoded with -32700.
    void handle_decode_error(const McpParseError& e);

    /// Enter ShuttingDown. New requests are refused from now on.
    /// Idempotent; the shutdown callback runs on the first call only.
    void begin_shutdown();

    /// Wait up to shutdown_grace for in-flight calls, then answer whatever
    /// is left with -32000. Returns true if nothing had to be abandoned.
    bool wait_drained();

    /// Invoked once when the session starts shutting down, from whichever
    /// thread triggered it.
    void set_shutdown_callback(std::function<void()> cb);

    size_t in_flight() const;

    Session& session() { return session_; }

private:
    struct InFlightCall {
        RequestId id;
        std::string tool;
        std::chrono::milliseconds timeout{0};
        std::optional<std::chrono::steady_clock::time_point> deadline;
        uint64_t seq{0};  // tells apart calls that reuse an id
        std::thread::id worker;  // set once a worker picks the call up
    };

    void register_handlers();

    HandlerResult on_initialize(const JsonRpcRequest& req);
    HandlerResult on_list_tools(const JsonRpcRequest& req);
    HandlerResult on_call_tool(const JsonRpcRequest& req);
    void on_initialized();
    void on_cancelled(const nlohmann::json& params);

    ToolOutcome run_tool(const ToolDescriptor& tool, const nlohmann::json& arguments,
                         const RequestId& id);
    void complete(const std::string& key, uint64_t seq, ToolOutcome outcome);

    /// Record the running worker; false if the call is already gone.
    bool mark_started(const std::string& key, uint64_t seq);

    /// Remove the entry; false if something else already completed it.
    /// A non-zero seq must match the entry's.
    bool claim(const std::string& key, InFlightCall* out, uint64_t seq = 0);
    void finish_send();

    void watchdog_loop();
    void send(const JsonRpcMessage& msg);

    Session& session_;
    Sink sink_;
    Options opts_;
    std::shared_ptr<spdlog::logger> logger_;
    Router router_;

    std::mutex send_mutex_;

    mutable std::mutex inflight_mutex_;
    std::map<std::string, InFlightCall> in_flight_;
    size_t sending_{0};            // claimed but not yet written
    uint64_t next_seq_{1};
    bool accepting_{true};
    bool stopping_{false};
    std::condition_variable watchdog_cv_;
    std::condition_variable drained_cv_;

    std::mutex callback_mutex_;
    std::function<void()> shutdown_cb_;
    std::atomic<bool> shutdown_requested_{false};

    std::thread watchdog_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace toolwire
