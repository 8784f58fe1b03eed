#include "toolwire/dispatcher.hpp"
#include "toolwire/log.hpp"
#include "toolwire/schema.hpp"
#include <algorithm>
#include <exception>
#include <vector>

namespace toolwire {

namespace {

// Integer 7 and string "7" are different ids.
std::string key_of(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return "i:" + std::to_string(*i);
    return "s:" + std::get<std::string>(id);
}

JsonRpcError invalid_params(std::string message) {
    return JsonRpcError{error::InvalidParams, std::move(message), std::nullopt};
}

JsonRpcError internal_error() {
    return JsonRpcError{error::InternalError, "Internal error", std::nullopt};
}

std::optional<size_t> parse_cursor(const nlohmann::json& cursor) {
    if (!cursor.is_string()) return std::nullopt;
    const auto& s = cursor.get_ref<const std::string&>();
    if (s.empty() || s.size() > 18) return std::nullopt;
    size_t n = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        n = n * 10 + static_cast<size_t>(c - '0');
    }
    return n;
}

} // anonymous namespace

Dispatcher::Dispatcher(Session& session, Sink sink, Options opts)
    : session_(session),
      sink_(std::move(sink)),
      opts_(std::move(opts)),
      logger_(log::or_default(opts_.logger)),
      router_(logger_) {
    register_handlers();
    // The watchdog hands stuck workers back to the pool.
    pool_ = std::make_unique<WorkerPool>(opts_.worker_threads, logger_);
    watchdog_ = std::thread([this] { watchdog_loop(); });
}

Dispatcher::~Dispatcher() {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        stopping_ = true;
    }
    watchdog_cv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();
    pool_->stop();
}

void Dispatcher::register_handlers() {
    router_.on_request("initialize", [this](const JsonRpcRequest& req) {
        return on_initialize(req);
    });
    router_.require_state("initialize", SessionState::NotConnected);

    router_.on_request("ping", [](const JsonRpcRequest&) -> HandlerResult {
        return nlohmann::json::object();
    });

    router_.on_request("tools/list", [this](const JsonRpcRequest& req) {
        return on_list_tools(req);
    });

    router_.on_request("tools/call", [this](const JsonRpcRequest& req) {
        return on_call_tool(req);
    });

    // Answered first; the transition happens once the reply is out.
    router_.on_request("shutdown", [this](const JsonRpcRequest&) -> HandlerResult {
        shutdown_requested_ = true;
        return nlohmann::json::object();
    });

    router_.on_notification("notifications/initialized", [this](const nlohmann::json&) {
        on_initialized();
    });
    router_.require_state("notifications/initialized", SessionState::Initializing);

    router_.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
        on_cancelled(params);
    });
}

void Dispatcher::handle(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        logger_->debug("<- {} (id {})", req->method, to_string(req->id));
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        logger_->debug("<- {}", notif->method);
    }

    auto response = router_.dispatch(msg, session_);
    if (response) send(*response);

    if (shutdown_requested_.exchange(false)) {
        logger_->info("Shutdown requested by peer");
        begin_shutdown();
    }
}

void Dispatcher::handle_decode_error(const McpParseError& e) {
    logger_->warn("Discarding undecodable message: {}", e.what());
    send(make_error(e.id, JsonRpcError{error::ParseError, "Parse error",
                                       nlohmann::json{{"detail", e.what()}}}));
}

HandlerResult Dispatcher::on_initialize(const JsonRpcRequest& req) {
    if (!req.params || !req.params->is_object()) {
        return invalid_params("initialize expects an object");
    }
    const auto& params = *req.params;
    auto version = params.find("protocolVersion");
    if (version == params.end() || !version->is_string()) {
        return invalid_params("Missing or invalid 'protocolVersion'");
    }

    InitializeParams init;
    try {
        init = params.get<InitializeParams>();
    } catch (const nlohmann::json::exception& e) {
        return invalid_params(std::string("Malformed initialize params: ") + e.what());
    }

    // Echo the peer's revision when we speak it, otherwise offer our newest.
    std::string negotiated(PROTOCOL_VERSION);
    for (auto supported : SUPPORTED_PROTOCOL_VERSIONS) {
        if (init.protocol_version == supported) {
            negotiated = init.protocol_version;
            break;
        }
    }

    if (!session_.advance(SessionState::Initializing)) {
        return JsonRpcError{error::InvalidRequest, "Session already initialized", std::nullopt};
    }
    session_.set_protocol_version(negotiated);
    session_.set_client(init.client_info, init.capabilities);

    logger_->info("Initializing session with {} (protocol {})",
                  init.client_info ? init.client_info->name : std::string("unnamed client"),
                  negotiated);

    InitializeResult result;
    result.protocol_version = negotiated;
    result.capabilities.tools = nlohmann::json{{"listChanged", false}};
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;
    return nlohmann::json(result);
}

void Dispatcher::on_initialized() {
    if (session_.advance(SessionState::Ready)) {
        logger_->info("Session ready, {} tool(s) registered", session_.tools().size());
    }
}

HandlerResult Dispatcher::on_list_tools(const JsonRpcRequest& req) {
    const auto& tools = session_.tools().list();

    size_t start = 0;
    if (req.params && req.params->is_object()) {
        auto cursor = req.params->find("cursor");
        if (cursor != req.params->end() && !cursor->is_null()) {
            auto offset = parse_cursor(*cursor);
            if (!offset || *offset > tools.size() || opts_.page_size == 0) {
                return invalid_params("Invalid cursor");
            }
            start = *offset;
        }
    }

    size_t end = tools.size();
    if (opts_.page_size > 0) end = std::min(tools.size(), start + opts_.page_size);

    ListToolsResult result;
    result.tools.reserve(end - start);
    for (size_t i = start; i < end; ++i) result.tools.push_back(tools[i].definition);
    if (end < tools.size()) result.next_cursor = std::to_string(end);
    return nlohmann::json(result);
}

HandlerResult Dispatcher::on_call_tool(const JsonRpcRequest& req) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    const nlohmann::json& params = req.params ? *req.params : kEmpty;
    if (!params.is_object()) {
        return invalid_params("tools/call expects an object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return invalid_params("Missing or invalid tool 'name'");
    }
    const std::string name = name_it->get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end()) {
        if (!args_it->is_object()) return invalid_params("'arguments' must be an object");
        arguments = *args_it;
    }

    const ToolDescriptor* tool = session_.tools().find(name);
    if (!tool) {
        logger_->warn("Call to unknown tool '{}'", name);
        return JsonRpcError{error::MethodNotFound, "Tool not found: " + name,
                            nlohmann::json{{"name", name}}};
    }

    auto validation = tool->validator ? tool->validator->validate(arguments)
                                      : SchemaValidator::validate(tool->definition.input_schema,
                                                                  arguments);
    if (!validation) {
        logger_->debug("Arguments for '{}' rejected ({} violation(s))", name,
                       validation.violations.size());
        return JsonRpcError{error::InvalidParams, "Invalid params: " + name,
                            validation.to_error_data()};
    }

    InFlightCall call{req.id, name, std::chrono::milliseconds{0}, std::nullopt};
    if (tool->timeout) {
        call.timeout = *tool->timeout;
    } else if (opts_.call_timeout) {
        call.timeout = *opts_.call_timeout;
    }
    if (call.timeout.count() > 0) {
        call.deadline = std::chrono::steady_clock::now() + call.timeout;
    }

    const std::string key = key_of(req.id);
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        if (!accepting_) {
            return JsonRpcError{error::ConnectionClosing, "Connection closing", std::nullopt};
        }
        if (in_flight_.count(key) > 0) {
            return JsonRpcError{error::InvalidRequest,
                                "Duplicate request id: " + to_string(req.id), std::nullopt};
        }
        call.seq = next_seq_++;
        in_flight_.emplace(key, call);
    }
    if (call.deadline) watchdog_cv_.notify_all();

    RequestId id = req.id;
    try {
        pool_->submit([this, key, seq = call.seq, tool, id, args = std::move(arguments)]() {
            // Timed out or cancelled while queued.
            if (!mark_started(key, seq)) return;
            complete(key, seq, run_tool(*tool, args, id));
        });
    } catch (const McpError& e) {
        logger_->error("Cannot schedule '{}': {}", name, e.what());
        InFlightCall dropped;
        if (claim(key, &dropped)) {
            finish_send();
            return internal_error();
        }
    }
    return Deferred{};
}

ToolOutcome Dispatcher::run_tool(const ToolDescriptor& tool, const nlohmann::json& arguments,
                                 const RequestId& id) {
    try {
        auto future = tool.handler(arguments);
        return future.get();
    } catch (const McpProtocolError& e) {
        return ToolFault{JsonRpcError{e.code, e.what(), e.data}};
    } catch (const std::exception& e) {
        logger_->error("Tool '{}' (id {}) failed: {}", tool.name(), to_string(id), e.what());
        return ToolFault{internal_error()};
    } catch (...) {
        logger_->error("Tool '{}' (id {}) threw a non-standard exception",
                       tool.name(), to_string(id));
        return ToolFault{internal_error()};
    }
}

void Dispatcher::complete(const std::string& key, uint64_t seq, ToolOutcome outcome) {
    InFlightCall call;
    if (!claim(key, &call, seq)) {
        logger_->debug("Discarding late result for {}", key);
        return;
    }

    if (auto* result = std::get_if<CallToolResult>(&outcome)) {
        send(make_result(call.id, nlohmann::json(*result)));
    } else {
        send(make_error(call.id, std::get<ToolFault>(outcome).error));
    }
    finish_send();
}

bool Dispatcher::mark_started(const std::string& key, uint64_t seq) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    auto it = in_flight_.find(key);
    if (it == in_flight_.end() || it->second.seq != seq) return false;
    it->second.worker = std::this_thread::get_id();
    return true;
}

bool Dispatcher::claim(const std::string& key, InFlightCall* out, uint64_t seq) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    auto it = in_flight_.find(key);
    if (it == in_flight_.end()) return false;
    if (seq != 0 && it->second.seq != seq) return false;
    *out = std::move(it->second);
    in_flight_.erase(it);
    ++sending_;
    return true;
}

void Dispatcher::finish_send() {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        --sending_;
    }
    drained_cv_.notify_all();
}

void Dispatcher::on_cancelled(const nlohmann::json& params) {
    auto it = params.find("requestId");
    if (it == params.end() || !(it->is_number_integer() || it->is_string())) {
        logger_->warn("notifications/cancelled without a usable requestId");
        return;
    }
    RequestId id = it->is_string() ? RequestId{it->get<std::string>()}
                                   : RequestId{it->get<int64_t>()};

    std::string reason;
    auto reason_it = params.find("reason");
    if (reason_it != params.end() && reason_it->is_string()) {
        reason = ": " + reason_it->get<std::string>();
    }

    InFlightCall call;
    if (claim(key_of(id), &call)) {
        finish_send();
        logger_->info("Call {} to '{}' cancelled by peer{}", to_string(id), call.tool, reason);
    } else {
        logger_->debug("Cancellation for {} ignored, not in flight", to_string(id));
    }
}

void Dispatcher::begin_shutdown() {
    if (!session_.advance(SessionState::ShuttingDown)) return;
    logger_->info("Session shutting down, {} call(s) in flight", in_flight());

    std::function<void()> cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = shutdown_cb_;
    }
    if (cb) cb();
}

bool Dispatcher::wait_drained() {
    std::vector<InFlightCall> abandoned;
    bool clean = false;
    {
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        accepting_ = false;
        clean = drained_cv_.wait_for(lock, opts_.shutdown_grace, [this] {
            return in_flight_.empty() && sending_ == 0;
        });
        for (auto& entry : in_flight_) abandoned.push_back(std::move(entry.second));
        in_flight_.clear();
        sending_ += abandoned.size();
    }

    for (const auto& call : abandoned) {
        logger_->warn("Abandoning call {} to '{}' at shutdown", to_string(call.id), call.tool);
        send(make_error(call.id, JsonRpcError{error::ConnectionClosing, "Connection closing",
                                              nlohmann::json{{"reason", "shutdown"}}}));
        finish_send();
    }

    if (!clean) {
        // A completion claimed before the grace ran out may still be writing.
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        drained_cv_.wait(lock, [this] { return sending_ == 0; });
    }
    return clean;
}

void Dispatcher::set_shutdown_callback(std::function<void()> cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    shutdown_cb_ = std::move(cb);
}

size_t Dispatcher::in_flight() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return in_flight_.size();
}

void Dispatcher::watchdog_loop() {
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    while (!stopping_) {
        std::optional<std::chrono::steady_clock::time_point> next;
        for (const auto& entry : in_flight_) {
            const auto& d = entry.second.deadline;
            if (d && (!next || *d < *next)) next = d;
        }
        if (next) {
            watchdog_cv_.wait_until(lock, *next);
        } else {
            watchdog_cv_.wait(lock);
        }
        if (stopping_) break;

        const auto now = std::chrono::steady_clock::now();
        std::vector<InFlightCall> expired;
        for (auto it = in_flight_.begin(); it != in_flight_.end();) {
            if (it->second.deadline && *it->second.deadline <= now) {
                expired.push_back(std::move(it->second));
                it = in_flight_.erase(it);
            } else {
                ++it;
            }
        }
        if (expired.empty()) continue;
        sending_ += expired.size();

        lock.unlock();
        for (const auto& call : expired) {
            logger_->warn("Call {} to '{}' timed out after {} ms", to_string(call.id), call.tool,
                          call.timeout.count());
            send(make_error(call.id, JsonRpcError{
                error::InternalError, "Request timed out",
                nlohmann::json{{"reason", "timeout"}, {"timeoutMs", call.timeout.count()}}}));
            finish_send();
        }
        // The handler keeps its thread; give the queue another one.
        for (const auto& call : expired) {
            if (call.worker != std::thread::id()) pool_->replace_worker(call.worker);
        }
        lock.lock();
    }
}

void Dispatcher::send(const JsonRpcMessage& msg) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    try {
        sink_(msg);
    } catch (const std::exception& e) {
        logger_->error("Failed to send message: {}", e.what());
    }
}

} // namespace toolwire
