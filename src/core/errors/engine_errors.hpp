#pragma once
#include <string>
#include <variant>

namespace conduit::core::errors {

    // Typed error categories shared by every component
    enum class ErrorCategory {
        Validation, // Malformed arguments, duplicate registration
        NotFound,   // Unknown tool, job, subscription or correlation
        Overload,   // Circuit open, queue full, component closed
        Timeout,    // Deadline exceeded during execution or retry wait
        Execution,  // A tool reported a failure
        Internal    // Unexpected failure or caught exception
    };

    // The standardized error payload
    struct EngineError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a successful value of type T, OR an EngineError.
    template <typename T>
    using Result = std::variant<T, EngineError>;

    // Result for operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<EngineError>(result);
    }

    template <typename T>
    const EngineError& get_error(const Result<T>& result) {
        return std::get<EngineError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation:
                return "validation";
            case ErrorCategory::NotFound:
                return "not_found";
            case ErrorCategory::Overload:
                return "overload";
            case ErrorCategory::Timeout:
                return "timeout";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

    // "[code] message" form used in log lines and CLI output.
    inline std::string describe(const EngineError& error) {
        return "[" + error.code + "] " + error.message;
    }

} // namespace conduit::core::errors
