#include "protocol/tool_contract.hpp"

namespace conduit::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;

core::errors::Status validate_input(const ToolSchema& schema, const ToolInput& input) {
    if (!input.data.is_object()) {
        return EngineError{ErrorCategory::Validation,
                           "Input data for tool " + schema.name + " must be an object.",
                           "invalid_tool_input"};
    }

    const auto required = schema.input_schema.find("required");
    if (required == schema.input_schema.end() || !required->is_array()) {
        return core::errors::ok();
    }

    for (const auto& key : *required) {
        if (!key.is_string()) {
            continue;
        }
        const std::string name = key.get<std::string>();
        if (!input.data.contains(name)) {
            return EngineError{ErrorCategory::Validation,
                               "Tool " + schema.name + " requires input field '" + name + "'.",
                               "missing_required_field",
                               "Check the tool schema for required fields."};
        }
    }
    return core::errors::ok();
}

}  // namespace conduit::protocol
