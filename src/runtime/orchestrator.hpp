#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/engine_config.hpp"
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "events/event_bus.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace conduit::runtime {

// Synchronous dispatch of single tool calls and sequential workflows.
class Orchestrator : public ToolDispatcher {
public:
    explicit Orchestrator(std::shared_ptr<tools::ToolRegistry> registry,
                          core::config::OrchestratorSettings settings = {},
                          events::EventBus* event_bus = nullptr);

    core::errors::Result<protocol::ToolOutput> execute(
        const core::context::ExecutionContext& ctx, const std::string& tool_name,
        const protocol::ToolInput& input);

    core::errors::Result<protocol::ToolOutput> dispatch(
        const core::context::ExecutionContext& ctx, const std::string& tool_name,
        const protocol::ToolInput& input) override;

    // Runs steps in order and stops at the first failing one.
    core::errors::Result<protocol::WorkflowResult> execute_workflow(
        const core::context::ExecutionContext& ctx, const protocol::Workflow& workflow);

    core::errors::Status register_tool(std::shared_ptr<protocol::Tool> tool);
    core::errors::Status unregister_tool(const std::string& name);
    std::vector<std::string> list_tools() const;
    nlohmann::json health() const;

    // Idempotent; later execute calls fail with orchestrator_closed.
    void close();
    bool closed() const { return closed_.load(); }

    std::uint64_t request_count() const { return requests_.load(); }
    std::uint64_t error_count() const { return errors_.load(); }

private:
    protocol::StepResult run_step(const core::context::ExecutionContext& ctx,
                                  const protocol::Workflow& workflow, const std::string& workflow_id,
                                  std::size_t index);
    void publish(protocol::EventType type, nlohmann::json data) const;

    std::shared_ptr<tools::ToolRegistry> registry_;
    const core::config::OrchestratorSettings settings_;
    events::EventBus* event_bus_;

    std::atomic_bool closed_{false};
    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> errors_{0};
    std::atomic<std::uint64_t> total_duration_us_{0};
};

}  // namespace conduit::runtime
