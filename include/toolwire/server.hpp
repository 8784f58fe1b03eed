#pragma once
#include "framing.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace toolwire {

/// An MCP server exposing tools over one transport. Register tools, then
/// call serve(); it returns once the session has shut down and every
/// pending reply has been written.
class ToolServer {
public:
    struct Options {
        Implementation server_info{"toolwire", std::nullopt, std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        size_t worker_threads = 4;
        std::optional<std::chrono::milliseconds> call_timeout;
        std::chrono::milliseconds shutdown_grace{5000};
        size_t page_size = 0;
        Framing framing = Framing::Newline;  // used by serve_stdio()
        std::shared_ptr<spdlog::logger> logger;
    };

    explicit ToolServer(Options opts);
    ~ToolServer();

    // Non-copyable, non-movable
    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    // ---- Tool registration ----
    // Allowed until the peer completes initialization. Throws
    // McpDuplicateToolError or McpRegistryError.
    void add_tool(ToolDefinition def, ToolHandler handler,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void add_tool_async(ToolDefinition def, AsyncToolHandler handler,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ---- Transport ----
    /// Serve one session. Blocks. A ToolServer serves at most once.
    /// After shutdown begins input is still read until in-flight calls
    /// drain; requests arriving meanwhile are refused with -32000.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();

    /// Begin shutting down: refuse new requests, drain, then close. Safe to
    /// call from any thread, including tool handlers.
    void shutdown();

    bool is_running() const;
    SessionState state() const;
    const ToolRegistry& tools() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolwire
