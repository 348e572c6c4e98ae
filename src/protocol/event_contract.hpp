#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace conduit::protocol {

    // Lifecycle events broadcast on the event bus. Subscriptions are keyed
    // by this discriminant.
    enum class EventType {
        RequestStarted,
        RequestCompleted,
        RequestFailed,
        CircuitBreakerOpen,
        JobSubmitted,
        JobStarted,
        JobCompleted,
        JobFailed,
        JobCancelled,
        ToolRegistered,
        ToolUnregistered,
        WorkflowStarted,
        WorkflowCompleted
    };

    // Immutable once published.
    struct Event {
        std::string id;
        EventType type;
        std::string source;
        nlohmann::json data = nlohmann::json::object();
        std::chrono::system_clock::time_point timestamp;
        std::optional<std::string> session_id;
    };

    inline std::string to_string(const EventType type) {
        switch (type) {
            case EventType::RequestStarted: return "request_started";
            case EventType::RequestCompleted: return "request_completed";
            case EventType::RequestFailed: return "request_failed";
            case EventType::CircuitBreakerOpen: return "circuit_breaker_open";
            case EventType::JobSubmitted: return "job_submitted";
            case EventType::JobStarted: return "job_started";
            case EventType::JobCompleted: return "job_completed";
            case EventType::JobFailed: return "job_failed";
            case EventType::JobCancelled: return "job_cancelled";
            case EventType::ToolRegistered: return "tool_registered";
            case EventType::ToolUnregistered: return "tool_unregistered";
            case EventType::WorkflowStarted: return "workflow_started";
            case EventType::WorkflowCompleted: return "workflow_completed";
            default: return "unknown";
        }
    }

} // namespace conduit::protocol
