#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/config/id_generator.hpp"
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"
#include "events/event_bus.hpp"
#include "protocol/serialization.hpp"
#include "resilience/communication_manager.hpp"
#include "runtime/orchestrator.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitExecutionFailure = 1;
constexpr int kExitInputError = 2;
constexpr int kExitConfigError = 3;

void log_error(const std::string& what, const conduit::core::errors::EngineError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

conduit::core::errors::Result<conduit::core::config::EngineConfig> load_config(
    const conduit::app::cli::CliRequest& req) {
    conduit::core::config::EngineConfig config;
    if (req.config_file.has_value()) {
        auto loaded = conduit::core::config::load_engine_config_file(req.config_file.value());
        if (conduit::core::errors::is_error(loaded)) {
            return conduit::core::errors::get_error(loaded);
        }
        config = conduit::core::errors::get_value(loaded);
    }
    return conduit::core::config::apply_environment_overrides(config);
}

int list_tools(const conduit::tools::ToolRegistry& registry) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& name : registry.list()) {
        const auto tool = registry.find(name);
        if (tool) {
            tools.push_back(conduit::protocol::to_json(tool->schema()));
        }
    }
    std::cout << tools.dump(2) << std::endl;
    return kExitSuccess;
}

int call_tool(conduit::resilience::CommunicationManager& comms,
              const conduit::app::cli::CliRequest& req) {
    conduit::resilience::CommunicationRequest request;
    request.tool_name = req.tool;
    request.session_id = req.session_id;
    request.input.session_id = req.session_id;
    request.input.data = req.input;
    request.correlation_id = conduit::core::config::generate_id("req");
    const std::string correlation_id = request.correlation_id;

    auto result = comms.send_request(conduit::core::context::ExecutionContext::background(),
                                     std::move(request));

    nlohmann::json report;
    const auto correlation = comms.get_correlation(correlation_id);
    if (correlation.has_value()) {
        report["correlation"] = conduit::resilience::to_json(correlation.value());
    }
    const auto metrics = comms.get_metrics(req.tool);
    if (metrics.has_value()) {
        report["metrics"] = conduit::resilience::to_json(metrics.value());
    }

    if (conduit::core::errors::is_error(result)) {
        const auto& err = conduit::core::errors::get_error(result);
        log_error("Tool call failed", err);
        report["error"] = conduit::protocol::to_json(err);
        std::cout << report.dump(2) << std::endl;
        return err.category == conduit::core::errors::ErrorCategory::NotFound ||
                       err.category == conduit::core::errors::ErrorCategory::Validation
                   ? kExitInputError
                   : kExitExecutionFailure;
    }

    const auto& output = conduit::core::errors::get_value(result);
    report["output"] = conduit::protocol::to_json(output);
    std::cout << report.dump(2) << std::endl;
    return output.success ? kExitSuccess : kExitExecutionFailure;
}

int run_workflow(conduit::runtime::Orchestrator& orchestrator,
                 const conduit::app::cli::CliRequest& req) {
    std::ifstream in(req.workflow_file);
    if (!in) {
        LOG_ERROR("Unable to open workflow file: " + req.workflow_file.string());
        return kExitInputError;
    }
    const auto document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        LOG_ERROR("Workflow file is not valid JSON: " + req.workflow_file.string());
        return kExitInputError;
    }

    auto workflow = conduit::protocol::workflow_from_json(document);
    if (conduit::core::errors::is_error(workflow)) {
        log_error("Invalid workflow", conduit::core::errors::get_error(workflow));
        return kExitInputError;
    }

    auto result = orchestrator.execute_workflow(
        conduit::core::context::ExecutionContext::background(),
        conduit::core::errors::get_value(workflow));
    if (conduit::core::errors::is_error(result)) {
        const auto& err = conduit::core::errors::get_error(result);
        log_error("Workflow rejected", err);
        return err.category == conduit::core::errors::ErrorCategory::Validation
                   ? kExitInputError
                   : kExitExecutionFailure;
    }

    const auto& summary = conduit::core::errors::get_value(result);
    for (const auto& step : summary.step_results) {
        LOG_INFO("Step " + step.step_id + " (" + step.step_name + " -> " + step.tool +
                 "): " + (step.success ? "ok" : "failed"));
    }
    std::cout << conduit::protocol::to_json(summary).dump(2) << std::endl;
    return summary.success ? kExitSuccess : kExitExecutionFailure;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line with this process instance
    conduit::core::logging::Logger::get().set_instance_id(
        conduit::core::config::generate_id("conduit"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = conduit::app::cli::parse_and_validate(argc, argv);
    if (conduit::core::errors::is_error(parsed)) {
        log_error("Input error", conduit::core::errors::get_error(parsed));
        return kExitInputError;
    }
    const auto& req = conduit::core::errors::get_value(parsed);

    // 3. Configuration: defaults, then the file, then CONDUIT_* variables
    auto configured = load_config(req);
    if (conduit::core::errors::is_error(configured)) {
        log_error("Configuration error", conduit::core::errors::get_error(configured));
        return kExitConfigError;
    }
    const auto& config = conduit::core::errors::get_value(configured);
    conduit::core::logging::Logger::get().set_min_level(
        req.verbose ? conduit::core::logging::LogLevel::DEBUG : config.log_level);

    // 4. Wire the engine
    conduit::events::EventBus event_bus(config.events);
    auto registry = std::make_shared<conduit::tools::ToolRegistry>();
    conduit::runtime::Orchestrator orchestrator(registry, config.orchestrator, &event_bus);
    auto builtins = conduit::tools::register_builtin_tools(orchestrator);
    if (conduit::core::errors::is_error(builtins)) {
        log_error("Failed to register built-in tools", conduit::core::errors::get_error(builtins));
        return kExitConfigError;
    }
    conduit::resilience::CommunicationManager comms(orchestrator, config.resilience, &event_bus);

    int exit_code = kExitSuccess;
    switch (req.command) {
        case conduit::app::cli::Command::ListTools:
            exit_code = list_tools(*registry);
            break;
        case conduit::app::cli::Command::Call:
            exit_code = call_tool(comms, req);
            break;
        case conduit::app::cli::Command::RunWorkflow:
            exit_code = run_workflow(orchestrator, req);
            break;
    }

    orchestrator.close();
    event_bus.close();
    LOG_DEBUG("Events published: " + std::to_string(event_bus.published_events()) +
              ", dropped: " + std::to_string(event_bus.dropped_events()));
    return exit_code;
}
