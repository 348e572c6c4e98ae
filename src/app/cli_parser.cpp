#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <vector>

namespace conduit::app::cli {

    using namespace conduit::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> tool;
        std::optional<std::string> input;
        std::optional<std::string> session;
        std::optional<std::string> workflow_file;
        std::optional<std::string> config;
        bool verbose = false;
    };

    namespace {

        EngineError input_error(const std::string& message, const std::string& code,
                                const std::string& hint = "") {
            return EngineError{ErrorCategory::Validation, message, code, hint};
        }

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code ec;
            const bool exists = std::filesystem::exists(p, ec);
            if (ec || !exists) {
                return input_error(flag + " does not exist: " + raw, "invalid_path");
            }
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return input_error(flag + " is not a regular file: " + raw, "invalid_path");
            }
            return p;
        }

    }  // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        const std::string usage =
            "Usage: conduit_cli <list-tools | call --tool <name> [--input <json>] [--session <id>]"
            " | run-workflow --workflow-file <path>> [--config <path>] [--verbose]";
        if (argc < 2) {
            return input_error("No command provided.", "missing_command", usage);
        }

        CliRequest req;
        const std::string command = argv[1];
        if (command == "list-tools") {
            req.command = Command::ListTools;
        } else if (command == "call") {
            req.command = Command::Call;
        } else if (command == "run-workflow") {
            req.command = Command::RunWorkflow;
        } else {
            return input_error("Unknown command: " + command, "unknown_command", usage);
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* slot = nullptr;
            if (args[i] == "--tool") {
                slot = &raw.tool;
            } else if (args[i] == "--input") {
                slot = &raw.input;
            } else if (args[i] == "--session") {
                slot = &raw.session;
            } else if (args[i] == "--workflow-file") {
                slot = &raw.workflow_file;
            } else if (args[i] == "--config") {
                slot = &raw.config;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return input_error("Unknown argument: " + args[i], "unknown_argument");
            }

            if (i + 1 >= args.size()) {
                return input_error("Missing value for " + args[i], "missing_value");
            }
            *slot = args[++i];
        }

        // 3. Validator Phase: Enforce per-command flags
        req.verbose = raw.verbose;

        if (raw.config) {
            auto config = existing_file(raw.config.value(), "--config");
            if (is_error(config)) {
                return get_error(config);
            }
            req.config_file = get_value(config);
        }

        switch (req.command) {
            case Command::ListTools:
                if (raw.tool || raw.input || raw.session || raw.workflow_file) {
                    return input_error("list-tools takes no tool or workflow flags.", "conflicting_flags");
                }
                break;
            case Command::Call: {
                if (raw.workflow_file) {
                    return input_error("--workflow-file is only valid for run-workflow.", "conflicting_flags");
                }
                if (!raw.tool || raw.tool->empty()) {
                    return input_error("call requires --tool", "missing_required_flag");
                }
                req.tool = raw.tool.value();
                if (raw.session) req.session_id = raw.session.value();
                if (raw.input) {
                    // Exception-free JSON parsing
                    auto parsed = nlohmann::json::parse(raw.input.value(), nullptr, false);
                    if (parsed.is_discarded()) {
                        return input_error("--input is not valid JSON", "invalid_json",
                                           "Pass a JSON object, e.g. '{\"message\": \"hi\"}'.");
                    }
                    if (!parsed.is_object()) {
                        return input_error("--input must be a JSON object", "invalid_json");
                    }
                    req.input = std::move(parsed);
                }
                break;
            }
            case Command::RunWorkflow: {
                if (raw.tool || raw.input || raw.session) {
                    return input_error("run-workflow takes no --tool, --input or --session.", "conflicting_flags");
                }
                if (!raw.workflow_file) {
                    return input_error("run-workflow requires --workflow-file", "missing_required_flag");
                }
                auto path = existing_file(raw.workflow_file.value(), "--workflow-file");
                if (is_error(path)) {
                    return get_error(path);
                }
                req.workflow_file = get_value(path);
                break;
            }
        }

        return req;
    }

} // namespace conduit::app::cli
