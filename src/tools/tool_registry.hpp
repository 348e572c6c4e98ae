#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace conduit::tools {

// Concurrent name -> Tool map. Reads take a shared lock, writes an
// exclusive one, so check-and-set registration cannot lose updates.
class ToolRegistry {
public:
    core::errors::Status register_tool(std::shared_ptr<protocol::Tool> tool);
    core::errors::Status unregister_tool(const std::string& name);

    core::errors::Result<std::shared_ptr<protocol::Tool>> get_tool(
        const std::string& name) const;
    // Null when the name is not registered.
    std::shared_ptr<protocol::Tool> find(const std::string& name) const;
    bool contains(const std::string& name) const;

    // Registered names; order is not guaranteed.
    std::vector<std::string> list() const;
    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<protocol::Tool>> tools_;
};

}  // namespace conduit::tools
