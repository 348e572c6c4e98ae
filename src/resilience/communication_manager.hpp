#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/engine_config.hpp"
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "events/event_bus.hpp"
#include "protocol/tool_contract.hpp"
#include "resilience/circuit_breaker.hpp"
#include "runtime/tool_dispatcher.hpp"

namespace conduit::resilience {

enum class CorrelationStatus {
    Pending,
    Completed,
    Failed,
    CircuitBreakerOpen
};

std::string to_string(CorrelationStatus status);

struct CommunicationRequest {
    std::string correlation_id;
    std::optional<std::string> parent_id;
    std::string session_id;
    std::string tool_name;
    protocol::ToolInput input;
};

struct RequestCorrelation {
    std::string id;
    std::string root_request_id;
    std::optional<std::string> parent_id;
    std::string session_id;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    CorrelationStatus status = CorrelationStatus::Pending;
    std::vector<std::string> tool_chain;
    int attempts = 0;
};

struct RequestMetricsSnapshot {
    std::string tool_name;
    std::uint64_t total_requests = 0;
    std::uint64_t success_count = 0;
    std::uint64_t failure_count = 0;
    double p95_latency_ms = 0.0;
    double error_rate = 0.0;
    std::optional<std::chrono::system_clock::time_point> last_request_time;
};

// Per-tool counters with a rolling latency window. Guarded by its own mutex;
// the manager's map lock is released before this one is taken.
class RequestMetrics {
public:
    RequestMetrics(std::string tool_name, std::size_t window);

    void record(double latency_ms, bool success);
    RequestMetricsSnapshot snapshot() const;

private:
    const std::string tool_name_;
    const std::size_t window_;

    mutable std::mutex mutex_;
    std::uint64_t total_ = 0;
    std::uint64_t successes_ = 0;
    std::uint64_t failures_ = 0;
    std::deque<double> latencies_;
    double p95_ms_ = 0.0;
    std::optional<std::chrono::system_clock::time_point> last_request_time_;
};

nlohmann::json to_json(const RequestCorrelation& correlation);
nlohmann::json to_json(const RequestMetricsSnapshot& metrics);
nlohmann::json to_json(const CircuitBreakerSnapshot& breaker);

// 95th percentile by nearest rank over the given samples; 0 when empty.
double p95(std::vector<double> samples);

// Message-based classification: only transient-looking failures are retried,
// and never infrastructure categories.
bool is_retryable(const core::errors::EngineError& error);

// Resilient request path in front of any ToolDispatcher: correlation
// tracking, circuit breaking per tool, retry with exponential backoff and
// per-tool latency metrics.
class CommunicationManager {
public:
    CommunicationManager(runtime::ToolDispatcher& dispatcher,
                         core::config::ResilienceSettings settings = {},
                         events::EventBus* event_bus = nullptr);

    CommunicationManager(const CommunicationManager&) = delete;
    CommunicationManager& operator=(const CommunicationManager&) = delete;

    core::errors::Result<protocol::ToolOutput> send_request(
        const core::context::ExecutionContext& ctx, CommunicationRequest request);

    std::optional<RequestCorrelation> get_correlation(const std::string& correlation_id) const;
    std::optional<RequestMetricsSnapshot> get_metrics(const std::string& tool_name) const;
    std::vector<RequestMetricsSnapshot> all_metrics() const;
    std::vector<CircuitBreakerSnapshot> circuit_breakers() const;
    core::errors::Status reset_circuit_breaker(const std::string& tool_name);

    std::size_t correlation_count() const;

    // Delay before retry `retry` (1-based): base * 2^(retry-1), capped at max.
    std::chrono::milliseconds backoff_delay(int retry) const;

private:
    struct Attempted {
        core::errors::Result<protocol::ToolOutput> result;
        int attempts = 0;
    };

    Attempted send_with_retry(const core::context::ExecutionContext& ctx,
                              const CommunicationRequest& request);
    void open_correlation(const CommunicationRequest& request);
    void close_correlation(const std::string& correlation_id, CorrelationStatus status,
                           int attempts);
    void evict_correlations_locked();
    std::shared_ptr<RequestMetrics> metrics_for(const std::string& tool_name);
    void publish(protocol::EventType type, nlohmann::json data) const;

    runtime::ToolDispatcher& dispatcher_;
    const core::config::ResilienceSettings settings_;
    events::EventBus* event_bus_;
    CircuitBreakerRegistry breakers_;

    mutable std::shared_mutex correlations_mutex_;
    std::unordered_map<std::string, RequestCorrelation> correlations_;
    std::deque<std::string> correlation_order_;

    mutable std::shared_mutex metrics_mutex_;
    std::map<std::string, std::shared_ptr<RequestMetrics>> metrics_;
};

}  // namespace conduit::resilience
