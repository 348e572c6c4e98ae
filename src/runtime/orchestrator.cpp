#include "runtime/orchestrator.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace conduit::runtime {

using core::context::ExecutionContext;
using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::StepResult;
using protocol::ToolInput;
using protocol::ToolOutput;
using protocol::Workflow;
using protocol::WorkflowResult;

namespace {

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

// Workflow variables sit beneath the step input; step keys win.
nlohmann::json merge_step_input(const nlohmann::json& variables, const nlohmann::json& step_input) {
    nlohmann::json merged = variables.is_object() ? variables : nlohmann::json::object();
    if (step_input.is_object()) {
        for (auto it = step_input.begin(); it != step_input.end(); ++it) {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

}  // namespace

Orchestrator::Orchestrator(std::shared_ptr<tools::ToolRegistry> registry,
                           core::config::OrchestratorSettings settings,
                           events::EventBus* event_bus)
    : registry_(registry ? std::move(registry) : std::make_shared<tools::ToolRegistry>()),
      settings_(settings),
      event_bus_(event_bus) {}

core::errors::Result<ToolOutput> Orchestrator::execute(const ExecutionContext& ctx,
                                                       const std::string& tool_name,
                                                       const ToolInput& input) {
    if (closed_.load()) {
        return EngineError{ErrorCategory::Overload, "Orchestrator is closed.",
                           "orchestrator_closed"};
    }

    auto tool = registry_->find(tool_name);
    if (!tool) {
        LOG_WARN("Orchestrator: tool not found: " + tool_name);
        return EngineError{ErrorCategory::NotFound, "Tool not found: " + tool_name,
                           "tool_not_found"};
    }

    auto validation = protocol::validate_input(tool->schema(), input);
    if (core::errors::is_error(validation)) {
        return core::errors::get_error(validation);
    }

    const ExecutionContext call_ctx =
        ctx.has_deadline() ? ctx : ctx.with_timeout(settings_.default_timeout);

    requests_.fetch_add(1);
    const auto started = std::chrono::steady_clock::now();
    LOG_DEBUG("Orchestrator: executing " + tool_name + " (session " + input.session_id + ")");

    core::errors::Result<ToolOutput> result = ToolOutput{};
    try {
        result = tool->execute(call_ctx, input);
    } catch (const std::exception& ex) {
        result = EngineError{ErrorCategory::Internal,
                             "Tool " + tool_name + " threw: " + ex.what(), "tool_exception"};
    }

    const double duration_ms = elapsed_ms(started);
    total_duration_us_.fetch_add(static_cast<std::uint64_t>(duration_ms * 1000.0));

    if (core::errors::is_error(result)) {
        errors_.fetch_add(1);
        EngineError error = core::errors::get_error(result);
        if (call_ctx.deadline_exceeded() && error.category != ErrorCategory::Timeout) {
            error = EngineError{ErrorCategory::Timeout,
                                "Tool " + tool_name + " timed out: " + error.message,
                                "tool_execution_timeout"};
        }
        LOG_ERROR("Orchestrator: tool " + tool_name + " failed after " +
                  std::to_string(duration_ms) + "ms: " + core::errors::describe(error));
        return error;
    }

    const ToolOutput& output = core::errors::get_value(result);
    if (!output.success) {
        errors_.fetch_add(1);
        LOG_WARN("Orchestrator: tool " + tool_name + " reported failure after " +
                 std::to_string(duration_ms) + "ms: " + output.error);
    } else {
        LOG_INFO("Orchestrator: tool " + tool_name + " completed in " +
                 std::to_string(duration_ms) + "ms");
    }
    return result;
}

core::errors::Result<ToolOutput> Orchestrator::dispatch(const ExecutionContext& ctx,
                                                        const std::string& tool_name,
                                                        const ToolInput& input) {
    return execute(ctx, tool_name, input);
}

core::errors::Result<WorkflowResult> Orchestrator::execute_workflow(const ExecutionContext& ctx,
                                                                    const Workflow& workflow) {
    if (closed_.load()) {
        return EngineError{ErrorCategory::Overload, "Orchestrator is closed.",
                           "orchestrator_closed"};
    }
    if (workflow.steps.empty()) {
        return EngineError{ErrorCategory::Validation,
                           "Workflow " + workflow.name + " has no steps.", "empty_workflow"};
    }

    const std::string workflow_id =
        workflow.id.empty() ? core::config::generate_id("wf") : workflow.id;
    const auto started = std::chrono::steady_clock::now();

    WorkflowResult result;
    result.workflow_id = workflow_id;
    result.total_steps = workflow.steps.size();

    LOG_INFO("Orchestrator: workflow " + workflow_id + " (" + workflow.name + ") started with " +
             std::to_string(result.total_steps) + " steps");
    publish(protocol::EventType::WorkflowStarted,
            {{"workflow_id", workflow_id}, {"name", workflow.name},
             {"total_steps", result.total_steps}});

    for (std::size_t index = 0; index < workflow.steps.size(); ++index) {
        if (ctx.is_cancelled()) {
            result.error = "Workflow cancelled before step " + workflow.steps[index].name;
            break;
        }

        StepResult step = run_step(ctx, workflow, workflow_id, index);
        const bool step_ok = step.success;
        if (!step_ok) {
            result.error = "Step " + step.step_name + " failed: " + step.error;
        }
        result.step_results.push_back(std::move(step));

        if (!step_ok) {
            ++result.failed_steps;
            break;
        }
        ++result.successful_steps;
    }

    result.success = result.failed_steps == 0 && result.successful_steps == result.total_steps;
    result.duration_ms = elapsed_ms(started);

    LOG_INFO("Orchestrator: workflow " + workflow_id + " finished: " +
             (result.success ? "success" : "failed") + " (" +
             std::to_string(result.successful_steps) + "/" +
             std::to_string(result.total_steps) + " steps)");
    publish(protocol::EventType::WorkflowCompleted,
            {{"workflow_id", workflow_id},
             {"success", result.success},
             {"successful_steps", result.successful_steps},
             {"failed_steps", result.failed_steps},
             {"duration_ms", result.duration_ms}});
    return result;
}

StepResult Orchestrator::run_step(const ExecutionContext& ctx, const Workflow& workflow,
                                  const std::string& workflow_id, const std::size_t index) {
    const protocol::WorkflowStep& definition = workflow.steps[index];

    StepResult step;
    step.step_id = "step-" + std::to_string(index + 1);
    step.step_name = definition.name;
    step.tool = definition.tool;
    step.started_at = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();

    ToolInput input;
    const auto session = workflow.variables.find("session_id");
    if (session != workflow.variables.end() && session->is_string()) {
        input.session_id = session->get<std::string>();
    }
    input.data = merge_step_input(workflow.variables, definition.input);
    input.context = {{"workflow_id", workflow_id}, {"step_id", step.step_id},
                     {"step_name", definition.name}};

    auto execution = execute(ctx, definition.tool, input);
    if (core::errors::is_error(execution)) {
        step.success = false;
        step.error = core::errors::describe(core::errors::get_error(execution));
    } else {
        step.output = core::errors::get_value(execution);
        step.success = step.output.success;
        step.error = step.output.error;
    }

    step.finished_at = std::chrono::system_clock::now();
    step.duration_ms = elapsed_ms(started);
    return step;
}

core::errors::Status Orchestrator::register_tool(std::shared_ptr<protocol::Tool> tool) {
    const std::string name = tool ? tool->name() : std::string{};
    auto status = registry_->register_tool(std::move(tool));
    if (!core::errors::is_error(status)) {
        publish(protocol::EventType::ToolRegistered, {{"tool", name}});
    }
    return status;
}

core::errors::Status Orchestrator::unregister_tool(const std::string& name) {
    auto status = registry_->unregister_tool(name);
    if (!core::errors::is_error(status)) {
        publish(protocol::EventType::ToolUnregistered, {{"tool", name}});
    }
    return status;
}

std::vector<std::string> Orchestrator::list_tools() const {
    return registry_->list();
}

nlohmann::json Orchestrator::health() const {
    const std::uint64_t requests = requests_.load();
    const double average_ms =
        requests == 0 ? 0.0
                      : static_cast<double>(total_duration_us_.load()) / 1000.0 /
                            static_cast<double>(requests);
    return {{"status", closed_.load() ? "closed" : "healthy"},
            {"tools", registry_->size()},
            {"requests", requests},
            {"errors", errors_.load()},
            {"average_duration_ms", average_ms}};
}

void Orchestrator::close() {
    if (closed_.exchange(true)) {
        return;
    }
    LOG_INFO("Orchestrator: closed after " + std::to_string(requests_.load()) + " requests");
}

void Orchestrator::publish(const protocol::EventType type, nlohmann::json data) const {
    if (event_bus_ != nullptr) {
        event_bus_->publish(type, std::move(data));
    }
}

}  // namespace conduit::runtime
