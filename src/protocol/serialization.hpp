#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/job_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/workflow_contract.hpp"

namespace conduit::protocol {

// Milliseconds since the Unix epoch.
std::int64_t to_unix_ms(std::chrono::system_clock::time_point time);

nlohmann::json to_json(const ToolOutput& output);
nlohmann::json to_json(const ToolSchema& schema);
nlohmann::json to_json(const StepResult& step);
nlohmann::json to_json(const WorkflowResult& result);
nlohmann::json to_json(const Job& job);
nlohmann::json to_json(const OrchestratorStats& stats);
nlohmann::json to_json(const Event& event);
nlohmann::json to_json(const core::errors::EngineError& error);

// Reads {"id", "name", "variables", "steps": [{"name", "tool", "input"}]}.
core::errors::Result<Workflow> workflow_from_json(const nlohmann::json& document);

}  // namespace conduit::protocol
