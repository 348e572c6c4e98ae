#pragma once

#include <string>
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace conduit::runtime {

// Anything that can run a tool by name. The orchestrator is the production
// implementation; the communication manager wraps one.
class ToolDispatcher {
public:
    virtual ~ToolDispatcher() = default;

    virtual core::errors::Result<protocol::ToolOutput> dispatch(
        const core::context::ExecutionContext& ctx, const std::string& tool_name,
        const protocol::ToolInput& input) = 0;
};

}  // namespace conduit::runtime
