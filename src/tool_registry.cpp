#include "toolwire/tool_registry.hpp"
#include "toolwire/error.hpp"
#include <exception>
#include <memory>
#include <utility>

namespace toolwire {

AsyncToolHandler make_async(ToolHandler handler) {
    auto shared = std::make_shared<ToolHandler>(std::move(handler));
    return [shared](const nlohmann::json& arguments) {
        std::promise<CallToolResult> promise;
        try {
            promise.set_value((*shared)(arguments));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        return promise.get_future();
    };
}

void ToolRegistry::add(ToolDescriptor tool) {
    if (tool.name().empty()) {
        throw McpRegistryError("Tool name must not be empty");
    }
    if (!tool.definition.input_schema.is_object()) {
        throw McpRegistryError("Tool input schema must be a JSON object: " + tool.name());
    }
    if (!tool.handler) {
        throw McpRegistryError("Tool has no handler: " + tool.name());
    }
    if (tool.timeout && tool.timeout->count() <= 0) {
        throw McpRegistryError("Tool timeout must be positive: " + tool.name());
    }
    if (!tool.validator) {
        tool.validator = std::make_shared<const SchemaValidator>(tool.definition.input_schema);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) {
        throw McpRegistryError("Registry is frozen; cannot add tool: " + tool.name());
    }
    if (index_.count(tool.name()) > 0) {
        throw McpDuplicateToolError(tool.name());
    }
    index_.emplace(tool.name(), tools_.size());
    tools_.push_back(std::move(tool));
}

void ToolRegistry::freeze() {
    std::lock_guard<std::mutex> lock(mutex_);
    frozen_ = true;
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &tools_[it->second];
}

} // namespace toolwire
