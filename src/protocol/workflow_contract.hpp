#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace conduit::protocol {

struct WorkflowStep {
    std::string name;
    std::string tool;
    nlohmann::json input = nlohmann::json::object();
};

// Ordered tool steps executed with stop-on-first-failure semantics.
struct Workflow {
    std::string id;
    std::string name;
    std::vector<WorkflowStep> steps;
    nlohmann::json variables = nlohmann::json::object();
};

struct StepResult {
    std::string step_id;
    std::string step_name;
    std::string tool;
    bool success = false;
    ToolOutput output;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    double duration_ms = 0.0;
    std::string error;
};

struct WorkflowResult {
    std::string workflow_id;
    bool success = false;
    std::size_t total_steps = 0;
    std::size_t successful_steps = 0;
    std::size_t failed_steps = 0;
    std::vector<StepResult> step_results;
    double duration_ms = 0.0;
    std::string error;
};

}  // namespace conduit::protocol
