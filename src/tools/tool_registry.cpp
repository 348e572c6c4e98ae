#include "tools/tool_registry.hpp"

#include <mutex>
#include <utility>
#include "core/logging/logger.hpp"

namespace conduit::tools {

using core::errors::EngineError;
using core::errors::ErrorCategory;

core::errors::Status ToolRegistry::register_tool(std::shared_ptr<protocol::Tool> tool) {
    if (!tool) {
        return EngineError{ErrorCategory::Validation, "Cannot register a null tool.",
                           "invalid_tool"};
    }
    const std::string name = tool->name();
    if (name.empty()) {
        return EngineError{ErrorCategory::Validation, "Tool name cannot be empty.",
                           "invalid_tool"};
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const bool inserted = tools_.emplace(name, std::move(tool)).second;
        if (!inserted) {
            return EngineError{ErrorCategory::Validation,
                               "Tool " + name + " is already registered.",
                               "tool_already_registered",
                               "Unregister the existing tool before replacing it."};
        }
    }
    LOG_INFO("ToolRegistry: registered tool " + name);
    return core::errors::ok();
}

core::errors::Status ToolRegistry::unregister_tool(const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (tools_.erase(name) == 0) {
            return EngineError{ErrorCategory::NotFound, "Tool not found: " + name,
                               "tool_not_found"};
        }
    }
    LOG_INFO("ToolRegistry: unregistered tool " + name);
    return core::errors::ok();
}

core::errors::Result<std::shared_ptr<protocol::Tool>> ToolRegistry::get_tool(
    const std::string& name) const {
    auto tool = find(name);
    if (!tool) {
        return EngineError{ErrorCategory::NotFound, "Tool not found: " + name,
                           "tool_not_found"};
    }
    return tool;
}

std::shared_ptr<protocol::Tool> ToolRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

std::vector<std::string> ToolRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& entry : tools_) {
        names.push_back(entry.first);
    }
    return names;
}

std::size_t ToolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

}  // namespace conduit::tools
