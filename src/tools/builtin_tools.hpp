#pragma once

#include <memory>
#include <string>
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/orchestrator.hpp"

namespace conduit::tools {

// Returns its input data unchanged.
class EchoTool : public protocol::Tool {
public:
    std::string name() const override { return "echo"; }
    std::string description() const override;
    protocol::ToolSchema schema() const override;
    core::errors::Result<protocol::ToolOutput> execute(
        const core::context::ExecutionContext& ctx, const protocol::ToolInput& input) override;
};

// Sleeps for data.duration_ms unless the context ends first. When
// data.fail_with is a non-empty string the call fails with that message
// after the wait; data.report_failure turns it into a tool-level failure
// instead of an error.
class WaitTool : public protocol::Tool {
public:
    std::string name() const override { return "wait"; }
    std::string description() const override;
    protocol::ToolSchema schema() const override;
    core::errors::Result<protocol::ToolOutput> execute(
        const core::context::ExecutionContext& ctx, const protocol::ToolInput& input) override;
};

// Registers echo and wait through the orchestrator so each registration is
// announced on its event bus. Fails on the first name already taken.
core::errors::Status register_builtin_tools(runtime::Orchestrator& orchestrator);

}  // namespace conduit::tools
