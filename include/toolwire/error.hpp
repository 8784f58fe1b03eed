#pragma once
#include "json_rpc.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace toolwire {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Framing or envelope failure; answered with -32700.
class McpParseError : public McpError {
public:
    /// Id recovered from a well-formed but invalid envelope, if any.
    std::optional<RequestId> id;

    explicit McpParseError(const std::string& msg,
                           std::optional<RequestId> id = std::nullopt)
        : McpError(msg), id(std::move(id)) {}
};

/// Thrown by handlers that want a specific JSON-RPC error on the wire.
class McpProtocolError : public McpError {
public:
    int code;
    std::optional<nlohmann::json> data;

    McpProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> data = std::nullopt)
        : McpError(msg), code(code), data(std::move(data)) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpRegistryError : public McpError {
public:
    using McpError::McpError;
};

class McpDuplicateToolError : public McpRegistryError {
public:
    explicit McpDuplicateToolError(const std::string& name)
        : McpRegistryError("Tool already registered: " + name) {}
};

namespace error {
    constexpr int ParseError        = -32700;
    constexpr int InvalidRequest    = -32600;
    constexpr int MethodNotFound    = -32601;
    constexpr int InvalidParams     = -32602;
    constexpr int InternalError     = -32603;
    constexpr int ConnectionClosing = -32000;
} // namespace error

} // namespace toolwire
