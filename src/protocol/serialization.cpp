#include "protocol/serialization.hpp"

#include <string>
#include <utility>

namespace conduit::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

EngineError invalid_workflow(const std::string& message) {
    return EngineError{ErrorCategory::Validation, message, "invalid_workflow"};
}

}  // namespace

std::int64_t to_unix_ms(const std::chrono::system_clock::time_point time) {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count());
}

json to_json(const ToolOutput& output) {
    json payload;
    payload["success"] = output.success;
    payload["data"] = output.data;
    payload["error"] = output.error;
    payload["metadata"] = output.metadata;
    return payload;
}

json to_json(const ToolSchema& schema) {
    json payload;
    payload["name"] = schema.name;
    payload["description"] = schema.description;
    payload["input_schema"] = schema.input_schema;
    payload["output_schema"] = schema.output_schema;
    return payload;
}

json to_json(const StepResult& step) {
    json payload;
    payload["id"] = step.step_id;
    payload["name"] = step.step_name;
    payload["tool"] = step.tool;
    payload["success"] = step.success;
    payload["output"] = to_json(step.output);
    payload["started_at_ms"] = to_unix_ms(step.started_at);
    payload["finished_at_ms"] = to_unix_ms(step.finished_at);
    payload["duration_ms"] = step.duration_ms;
    payload["error"] = step.error;
    return payload;
}

json to_json(const WorkflowResult& result) {
    json payload;
    payload["workflow_id"] = result.workflow_id;
    payload["success"] = result.success;
    payload["total_steps"] = result.total_steps;
    payload["successful_steps"] = result.successful_steps;
    payload["failed_steps"] = result.failed_steps;
    payload["duration_ms"] = result.duration_ms;
    payload["error"] = result.error;
    payload["steps"] = json::array();
    for (const auto& step : result.step_results) {
        payload["steps"].push_back(to_json(step));
    }
    return payload;
}

json to_json(const Job& job) {
    json payload;
    payload["id"] = job.id;
    payload["type"] = job.type;
    payload["status"] = to_string(job.status);
    payload["parameters"] = job.parameters;
    payload["result"] = job.result;
    payload["error"] = job.error;
    payload["created_at_ms"] = to_unix_ms(job.created_at);
    payload["started_at_ms"] =
        job.started_at.has_value() ? json(to_unix_ms(job.started_at.value())) : json();
    payload["completed_at_ms"] =
        job.completed_at.has_value() ? json(to_unix_ms(job.completed_at.value())) : json();
    return payload;
}

json to_json(const OrchestratorStats& stats) {
    return {{"total", stats.total},         {"pending", stats.pending},
            {"running", stats.running},     {"completed", stats.completed},
            {"failed", stats.failed},       {"cancelled", stats.cancelled}};
}

json to_json(const Event& event) {
    json payload;
    payload["id"] = event.id;
    payload["type"] = to_string(event.type);
    payload["source"] = event.source;
    payload["data"] = event.data;
    payload["timestamp_ms"] = to_unix_ms(event.timestamp);
    payload["session_id"] = event.session_id.has_value() ? json(event.session_id.value()) : json();
    return payload;
}

json to_json(const EngineError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

core::errors::Result<Workflow> workflow_from_json(const json& document) {
    if (!document.is_object()) {
        return invalid_workflow("Workflow document must be a JSON object.");
    }

    Workflow workflow;
    if (document.contains("id")) {
        if (!document["id"].is_string()) {
            return invalid_workflow("Workflow 'id' must be a string.");
        }
        workflow.id = document["id"].get<std::string>();
    }
    if (document.contains("name")) {
        if (!document["name"].is_string()) {
            return invalid_workflow("Workflow 'name' must be a string.");
        }
        workflow.name = document["name"].get<std::string>();
    }
    if (document.contains("variables")) {
        if (!document["variables"].is_object()) {
            return invalid_workflow("Workflow 'variables' must be an object.");
        }
        workflow.variables = document["variables"];
    }

    const auto steps = document.find("steps");
    if (steps == document.end() || !steps->is_array()) {
        return invalid_workflow("Workflow 'steps' must be an array.");
    }
    for (std::size_t index = 0; index < steps->size(); ++index) {
        const json& entry = (*steps)[index];
        const std::string where = "Workflow step " + std::to_string(index + 1);
        if (!entry.is_object()) {
            return invalid_workflow(where + " must be an object.");
        }
        const auto tool = entry.find("tool");
        if (tool == entry.end() || !tool->is_string() || tool->get<std::string>().empty()) {
            return invalid_workflow(where + " needs a non-empty 'tool'.");
        }

        WorkflowStep step;
        step.tool = tool->get<std::string>();
        step.name = step.tool;
        if (entry.contains("name")) {
            if (!entry["name"].is_string()) {
                return invalid_workflow(where + " 'name' must be a string.");
            }
            step.name = entry["name"].get<std::string>();
        }
        if (entry.contains("input")) {
            if (!entry["input"].is_object()) {
                return invalid_workflow(where + " 'input' must be an object.");
            }
            step.input = entry["input"];
        }
        workflow.steps.push_back(std::move(step));
    }
    return workflow;
}

}  // namespace conduit::protocol
