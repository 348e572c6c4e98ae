#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"

namespace conduit::app::cli {

    enum class Command {
        ListTools,
        Call,
        RunWorkflow
    };

    // Normalized command line, validated before any component is built
    struct CliRequest {
        Command command = Command::ListTools;
        std::string tool;
        nlohmann::json input = nlohmann::json::object();
        std::string session_id;
        std::filesystem::path workflow_file;
        std::optional<std::filesystem::path> config_file;
        bool verbose = false;
    };

    conduit::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}
