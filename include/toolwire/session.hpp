#pragma once
#include "types.hpp"
#include "tool_registry.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace toolwire {

enum class SessionState {
    NotConnected,
    Initializing,
    Ready,
    ShuttingDown
};

const char* to_string(SessionState s);

/// Per-peer protocol state. Owns the tool registry; no globals, so any
/// number of sessions may live in one process.
class Session {
public:
    Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionState state() const;

    /// Apply a lifecycle transition. Only NotConnected -> Initializing,
    /// Initializing -> Ready and <any live state> -> ShuttingDown are legal;
    /// anything else returns false and leaves the state unchanged.
    /// Entering Ready freezes the tool registry.
    bool advance(SessionState next);

    ToolRegistry& tools() { return tools_; }
    const ToolRegistry& tools() const { return tools_; }

    std::string protocol_version() const;
    void set_protocol_version(std::string version);

    /// Peer identity and capabilities as sent in initialize.
    void set_client(std::optional<Implementation> info, ClientCapabilities caps);
    std::optional<Implementation> client_info() const;
    ClientCapabilities client_capabilities() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::NotConnected};
    ToolRegistry tools_;
    std::string protocol_version_;
    std::optional<Implementation> client_info_;
    ClientCapabilities client_caps_;
};

} // namespace toolwire
