#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace toolwire {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;

/// Receives McpParseError for undecodable input (reading continues) and
/// McpTransportError for I/O failures (reading stops).
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop on the calling thread. Returns at end of input or
    /// after stop_reading()/shutdown(). Outgoing messages keep flowing
    /// until shutdown().
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue a message for the remote peer.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Make start() return without closing the outgoing side.
    virtual void stop_reading() = 0;

    /// Flush queued messages and close.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace toolwire
