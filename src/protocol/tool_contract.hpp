#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"

namespace conduit::protocol {

    // Describes what a tool accepts and returns. input_schema follows the
    // JSON-Schema shape; only its "required" list is enforced here.
    struct ToolSchema {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
        nlohmann::json output_schema = nlohmann::json::object();
    };

    // What a caller hands to a tool
    struct ToolInput {
        std::string session_id;
        nlohmann::json data = nlohmann::json::object();
        nlohmann::json context = nlohmann::json::object();
    };

    // What a tool hands back. A tool-level failure is success == false with
    // an error string; infrastructure failures are EngineErrors instead.
    struct ToolOutput {
        bool success = false;
        nlohmann::json data = nlohmann::json::object();
        std::string error;
        nlohmann::json metadata = nlohmann::json::object();
    };

    // A named unit of executable capability. Implementations must be safe to
    // call from several threads at once.
    class Tool {
    public:
        virtual ~Tool() = default;

        virtual std::string name() const = 0;
        virtual std::string description() const = 0;
        virtual ToolSchema schema() const = 0;
        virtual core::errors::Result<ToolOutput> execute(
            const core::context::ExecutionContext& ctx, const ToolInput& input) = 0;
    };

    // Checks the keys listed in schema.input_schema["required"] against input.data.
    core::errors::Status validate_input(const ToolSchema& schema, const ToolInput& input);

} // namespace conduit::protocol
