#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace toolwire {

/// Purely syntactic JSON-RPC 2.0 envelope codec. Knows nothing about
/// methods or params.
class Codec {
public:
    /// Parse one raw JSON message.
    /// Throws McpParseError on invalid JSON or a malformed envelope; the
    /// error carries the request id whenever one could be recovered.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to compact JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Validate an already-parsed JSON object as an envelope.
    [[nodiscard]] static JsonRpcMessage from_json_object(const nlohmann::json& j);
};

} // namespace toolwire
