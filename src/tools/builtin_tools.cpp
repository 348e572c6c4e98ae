#include "tools/builtin_tools.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace conduit::tools {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::ToolOutput;
using protocol::ToolSchema;

std::string EchoTool::description() const {
    return "Returns the input data unchanged.";
}

ToolSchema EchoTool::schema() const {
    ToolSchema schema;
    schema.name = name();
    schema.description = description();
    schema.input_schema = {{"type", "object"}};
    schema.output_schema = {{"type", "object"}};
    return schema;
}

core::errors::Result<ToolOutput> EchoTool::execute(const core::context::ExecutionContext& ctx,
                                                   const protocol::ToolInput& input) {
    if (ctx.is_cancelled()) {
        return EngineError{ErrorCategory::Timeout, "echo cancelled before it ran",
                           "tool_cancelled"};
    }
    ToolOutput output;
    output.success = true;
    output.data = input.data;
    output.metadata = {{"session_id", input.session_id}};
    return output;
}

std::string WaitTool::description() const {
    return "Sleeps for duration_ms, optionally failing afterwards with fail_with.";
}

ToolSchema WaitTool::schema() const {
    ToolSchema schema;
    schema.name = name();
    schema.description = description();
    schema.input_schema = {
        {"type", "object"},
        {"required", {"duration_ms"}},
        {"properties",
         {{"duration_ms", {{"type", "integer"}, {"minimum", 0}}},
          {"fail_with", {{"type", "string"}}},
          {"report_failure", {{"type", "boolean"}}}}}};
    schema.output_schema = {{"type", "object"}};
    return schema;
}

core::errors::Result<ToolOutput> WaitTool::execute(const core::context::ExecutionContext& ctx,
                                                   const protocol::ToolInput& input) {
    const auto duration = input.data.find("duration_ms");
    if (duration == input.data.end() || !duration->is_number_integer() ||
        duration->get<std::int64_t>() < 0) {
        return EngineError{ErrorCategory::Validation,
                           "duration_ms must be a non-negative integer.",
                           "invalid_tool_input"};
    }
    const auto wait = std::chrono::milliseconds(duration->get<std::int64_t>());

    const auto started = std::chrono::steady_clock::now();
    if (!ctx.sleep_for(wait)) {
        return EngineError{ErrorCategory::Timeout,
                           "wait interrupted by timeout or cancellation", "wait_interrupted"};
    }
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started)
                            .count();

    const auto fail_with = input.data.find("fail_with");
    if (fail_with != input.data.end() && fail_with->is_string() &&
        !fail_with->get<std::string>().empty()) {
        const std::string message = fail_with->get<std::string>();
        const auto report = input.data.find("report_failure");
        if (report != input.data.end() && report->is_boolean() && report->get<bool>()) {
            ToolOutput output;
            output.success = false;
            output.error = message;
            output.data = {{"waited_ms", waited}};
            return output;
        }
        return EngineError{ErrorCategory::Execution, message, "tool_failed"};
    }

    ToolOutput output;
    output.success = true;
    output.data = {{"waited_ms", waited}};
    return output;
}

core::errors::Status register_builtin_tools(runtime::Orchestrator& orchestrator) {
    auto echo = orchestrator.register_tool(std::make_shared<EchoTool>());
    if (core::errors::is_error(echo)) {
        return echo;
    }
    return orchestrator.register_tool(std::make_shared<WaitTool>());
}

}  // namespace conduit::tools
