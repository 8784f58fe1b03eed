#pragma once
#include "schema.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolwire {

/// Handler callbacks receive the already validated "arguments" object.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;
using AsyncToolHandler = std::function<std::future<CallToolResult>(const nlohmann::json& arguments)>;

/// Adapt a synchronous handler to the asynchronous form. The returned
/// future is already satisfied when the call returns; exceptions are
/// captured in it.
AsyncToolHandler make_async(ToolHandler handler);

struct ToolDescriptor {
    ToolDefinition definition;
    AsyncToolHandler handler;
    std::optional<std::chrono::milliseconds> timeout;
    // Compiled input schema, set by ToolRegistry::add.
    std::shared_ptr<const SchemaValidator> validator;

    const std::string& name() const { return definition.name; }
};

/// Name -> tool table. Append and lookup only. add() may race freeze()
/// from another thread; once frozen the table never changes again, so
/// lookups after that need no lock. Reads while tools are still being
/// added from another thread are not supported.
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Throws McpDuplicateToolError if the name is taken, McpRegistryError
    /// if the descriptor is invalid or the registry is frozen.
    void add(ToolDescriptor tool);

    /// Registered tools in insertion order.
    const std::vector<ToolDescriptor>& list() const { return tools_; }

    /// nullptr when no tool has that name.
    const ToolDescriptor* find(const std::string& name) const;

    bool contains(const std::string& name) const { return index_.count(name) > 0; }
    size_t size() const { return tools_.size(); }

    void freeze();
    bool frozen() const { return frozen_; }

private:
    std::mutex mutex_;
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_;
    std::atomic<bool> frozen_{false};
};

} // namespace toolwire
