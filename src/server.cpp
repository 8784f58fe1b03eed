#include "toolwire/server.hpp"
#include "toolwire/dispatcher.hpp"
#include "toolwire/error.hpp"
#include "toolwire/log.hpp"
#include "toolwire/transport/stdio_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace toolwire {

struct ToolServer::Impl {
    Options opts;
    std::shared_ptr<spdlog::logger> logger;
    Session session;

    // Transport of the current serve() call
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    std::atomic<bool> served{false};

    // Set by the dispatcher's shutdown callback, consumed by the drainer
    std::mutex drain_mutex;
    std::condition_variable drain_cv;
    bool shutdown_begun{false};

    // Declared last: joins its workers before anything above goes away.
    std::unique_ptr<Dispatcher> dispatcher;

    explicit Impl(Options o)
        : opts(std::move(o)), logger(log::or_default(opts.logger)) {
        Dispatcher::Options dopts;
        dopts.server_info = opts.server_info;
        dopts.instructions = opts.instructions;
        dopts.worker_threads = opts.worker_threads;
        dopts.call_timeout = opts.call_timeout;
        dopts.shutdown_grace = opts.shutdown_grace;
        dopts.page_size = opts.page_size;
        dopts.logger = logger;
        dispatcher = std::make_unique<Dispatcher>(
            session, [this](const JsonRpcMessage& msg) { send_message(msg); }, std::move(dopts));
        dispatcher->set_shutdown_callback([this] { on_shutdown(); });
    }

    // Runs on whichever thread began the shutdown, often the reader.
    void on_shutdown() {
        {
            std::lock_guard<std::mutex> lock(drain_mutex);
            shutdown_begun = true;
        }
        drain_cv.notify_all();
    }

    // Input is still read while in-flight calls finish, so late requests
    // get a -32000 answer instead of silence. Reading stops once drained.
    void drain() {
        {
            std::unique_lock<std::mutex> lock(drain_mutex);
            drain_cv.wait(lock, [this] { return shutdown_begun; });
        }
        if (!dispatcher->wait_drained()) {
            logger->warn("Shutdown grace expired with calls still running");
        }
        stop_reading();
    }

    void send_message(const JsonRpcMessage& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (transport) {
            transport->send(msg);
        } else {
            logger->debug("No transport, dropping outgoing message");
        }
    }

    void stop_reading() {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (transport) transport->stop_reading();
    }

    void on_error(std::exception_ptr e) {
        try {
            std::rethrow_exception(e);
        } catch (const McpParseError& pe) {
            dispatcher->handle_decode_error(pe);
        } catch (const McpTransportError& te) {
            logger->error("Transport failure: {}", te.what());
            dispatcher->begin_shutdown();
        } catch (const std::exception& ex) {
            logger->error("Unexpected transport error: {}", ex.what());
        }
    }

    void register_tool(ToolDescriptor tool) {
        const std::string name = tool.name();
        session.tools().add(std::move(tool));
        logger->debug("Registered tool '{}'", name);
    }
};

ToolServer::ToolServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
}

ToolServer::~ToolServer() = default;

void ToolServer::add_tool(ToolDefinition def, ToolHandler handler,
                          std::optional<std::chrono::milliseconds> timeout) {
    if (!handler) {
        throw McpRegistryError("Tool has no handler: " + def.name);
    }
    impl_->register_tool(ToolDescriptor{std::move(def), make_async(std::move(handler)), timeout});
}

void ToolServer::add_tool_async(ToolDefinition def, AsyncToolHandler handler,
                                std::optional<std::chrono::milliseconds> timeout) {
    impl_->register_tool(ToolDescriptor{std::move(def), std::move(handler), timeout});
}

void ToolServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw McpTransportError("serve() needs a transport");
    }
    if (impl_->served.exchange(true)) {
        throw McpError("A ToolServer serves a single session");
    }

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    impl_->running = true;
    impl_->logger->info("{} {} serving {} tool(s)", impl_->opts.server_info.name,
                        impl_->opts.server_info.version, impl_->session.tools().size());

    std::thread drainer([this] { impl_->drain(); });

    // shutdown() may already have been called.
    if (impl_->session.state() != SessionState::ShuttingDown) {
        try {
            t->start([this](JsonRpcMessage msg) { impl_->dispatcher->handle(msg); },
                     [this](std::exception_ptr e) { impl_->on_error(std::move(e)); });
        } catch (...) {
            impl_->dispatcher->begin_shutdown();
            drainer.join();
            throw;
        }
    }

    // End of input also begins the shutdown; the drainer finishes it.
    impl_->dispatcher->begin_shutdown();
    drainer.join();

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    t->shutdown();
    impl_->running = false;
    impl_->logger->info("Session closed");
}

void ToolServer::serve_stdio() {
    StdioTransport::Options topts;
    topts.framing = impl_->opts.framing;
    topts.logger = impl_->logger;
    serve(std::make_unique<StdioTransport>(std::move(topts)));
}

void ToolServer::shutdown() {
    impl_->dispatcher->begin_shutdown();
}

bool ToolServer::is_running() const {
    return impl_->running;
}

SessionState ToolServer::state() const {
    return impl_->session.state();
}

const ToolRegistry& ToolServer::tools() const {
    return impl_->session.tools();
}

} // namespace toolwire
