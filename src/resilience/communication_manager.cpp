#include "resilience/communication_manager.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "protocol/serialization.hpp"

namespace conduit::resilience {

using core::context::ExecutionContext;
using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::ToolOutput;

namespace {

constexpr std::array<const char*, 4> kRetryableMarkers = {"timeout", "connection", "temporary",
                                                          "unavailable"};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

}  // namespace

std::string to_string(const CorrelationStatus status) {
    switch (status) {
        case CorrelationStatus::Pending:
            return "pending";
        case CorrelationStatus::Completed:
            return "completed";
        case CorrelationStatus::Failed:
            return "failed";
        case CorrelationStatus::CircuitBreakerOpen:
            return "circuit_breaker_open";
        default:
            return "unknown";
    }
}

nlohmann::json to_json(const RequestCorrelation& correlation) {
    nlohmann::json payload;
    payload["id"] = correlation.id;
    payload["root_request_id"] = correlation.root_request_id;
    payload["parent_id"] =
        correlation.parent_id.has_value() ? nlohmann::json(correlation.parent_id.value())
                                          : nlohmann::json();
    payload["session_id"] = correlation.session_id;
    payload["status"] = to_string(correlation.status);
    payload["tool_chain"] = correlation.tool_chain;
    payload["attempts"] = correlation.attempts;
    payload["start_time_ms"] = protocol::to_unix_ms(correlation.start_time);
    payload["end_time_ms"] = correlation.end_time.has_value()
                                 ? nlohmann::json(protocol::to_unix_ms(correlation.end_time.value()))
                                 : nlohmann::json();
    return payload;
}

nlohmann::json to_json(const RequestMetricsSnapshot& metrics) {
    nlohmann::json payload;
    payload["tool"] = metrics.tool_name;
    payload["total_requests"] = metrics.total_requests;
    payload["success_count"] = metrics.success_count;
    payload["failure_count"] = metrics.failure_count;
    payload["p95_latency_ms"] = metrics.p95_latency_ms;
    payload["error_rate"] = metrics.error_rate;
    payload["last_request_time_ms"] =
        metrics.last_request_time.has_value()
            ? nlohmann::json(protocol::to_unix_ms(metrics.last_request_time.value()))
            : nlohmann::json();
    return payload;
}

nlohmann::json to_json(const CircuitBreakerSnapshot& breaker) {
    return {{"name", breaker.name},
            {"state", to_string(breaker.state)},
            {"failure_count", breaker.failure_count},
            {"max_failures", breaker.max_failures},
            {"reset_timeout_ms", breaker.reset_timeout.count()}};
}

double p95(std::vector<double> samples) {
    if (samples.empty()) {
        return 0.0;
    }
    std::sort(samples.begin(), samples.end());
    const auto rank = static_cast<std::size_t>(
        std::ceil(0.95 * static_cast<double>(samples.size())));
    return samples[std::max<std::size_t>(rank, 1) - 1];
}

bool is_retryable(const EngineError& error) {
    switch (error.category) {
        case ErrorCategory::NotFound:
        case ErrorCategory::Validation:
        case ErrorCategory::Overload:
            return false;
        default:
            break;
    }
    const std::string message = lowercase(error.message);
    for (const char* marker : kRetryableMarkers) {
        if (message.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

RequestMetrics::RequestMetrics(std::string tool_name, const std::size_t window)
    : tool_name_(std::move(tool_name)), window_(std::max<std::size_t>(1, window)) {}

void RequestMetrics::record(const double latency_ms, const bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_;
    if (success) {
        ++successes_;
    } else {
        ++failures_;
    }
    latencies_.push_back(latency_ms);
    while (latencies_.size() > window_) {
        latencies_.pop_front();
    }
    p95_ms_ = p95(std::vector<double>(latencies_.begin(), latencies_.end()));
    last_request_time_ = std::chrono::system_clock::now();
}

RequestMetricsSnapshot RequestMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RequestMetricsSnapshot snapshot;
    snapshot.tool_name = tool_name_;
    snapshot.total_requests = total_;
    snapshot.success_count = successes_;
    snapshot.failure_count = failures_;
    snapshot.p95_latency_ms = p95_ms_;
    snapshot.error_rate =
        total_ == 0 ? 0.0 : static_cast<double>(failures_) / static_cast<double>(total_);
    snapshot.last_request_time = last_request_time_;
    return snapshot;
}

CommunicationManager::CommunicationManager(runtime::ToolDispatcher& dispatcher,
                                           core::config::ResilienceSettings settings,
                                           events::EventBus* event_bus)
    : dispatcher_(dispatcher),
      settings_(settings),
      event_bus_(event_bus),
      breakers_(settings.breaker_max_failures, settings.breaker_reset_timeout,
                settings.max_breakers) {}

std::chrono::milliseconds CommunicationManager::backoff_delay(const int retry) const {
    if (retry <= 0) {
        return std::chrono::milliseconds(0);
    }
    const auto base = settings_.base_delay.count();
    const auto cap = settings_.max_delay.count();
    auto delay = base;
    for (int i = 1; i < retry && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

core::errors::Result<ToolOutput> CommunicationManager::send_request(const ExecutionContext& ctx,
                                                                    CommunicationRequest request) {
    if (request.correlation_id.empty()) {
        request.correlation_id = core::config::generate_id("req");
    }
    if (request.session_id.empty()) {
        request.session_id = request.input.session_id;
    } else if (request.input.session_id.empty()) {
        request.input.session_id = request.session_id;
    }
    const std::string& correlation_id = request.correlation_id;
    open_correlation(request);

    auto breaker = breakers_.get_or_create(request.tool_name);
    if (!breaker->allow()) {
        close_correlation(correlation_id, CorrelationStatus::CircuitBreakerOpen, 0);
        LOG_WARN("CommunicationManager: circuit breaker open for " + request.tool_name +
                 ", rejecting request " + correlation_id);
        publish(protocol::EventType::CircuitBreakerOpen,
                {{"correlation_id", correlation_id},
                 {"tool", request.tool_name},
                 {"session_id", request.session_id}});
        // A rejected request still starts, and ends without a completion event.
        publish(protocol::EventType::RequestStarted,
                {{"correlation_id", correlation_id},
                 {"tool", request.tool_name},
                 {"session_id", request.session_id},
                 {"status", to_string(CorrelationStatus::CircuitBreakerOpen)}});
        return EngineError{ErrorCategory::Overload,
                           "Circuit breaker is open for tool " + request.tool_name,
                           "circuit_breaker_open",
                           "Wait for the reset timeout or reset the breaker."};
    }

    publish(protocol::EventType::RequestStarted,
            {{"correlation_id", correlation_id},
             {"tool", request.tool_name},
             {"session_id", request.session_id}});

    const auto started = std::chrono::steady_clock::now();
    Attempted outcome = send_with_retry(ctx, request);
    const double duration_ms = elapsed_ms(started);

    const bool failed = core::errors::is_error(outcome.result) ||
                        !core::errors::get_value(outcome.result).success;
    if (failed) {
        breaker->record_failure();
    } else {
        breaker->record_success();
    }
    metrics_for(request.tool_name)->record(duration_ms, !failed);
    close_correlation(correlation_id,
                      failed ? CorrelationStatus::Failed : CorrelationStatus::Completed,
                      outcome.attempts);

    nlohmann::json data = {{"correlation_id", correlation_id},
                           {"tool", request.tool_name},
                           {"session_id", request.session_id},
                           {"duration_ms", duration_ms},
                           {"attempts", outcome.attempts}};
    if (failed) {
        const std::string error = core::errors::is_error(outcome.result)
                                      ? core::errors::describe(core::errors::get_error(outcome.result))
                                      : core::errors::get_value(outcome.result).error;
        data["error"] = error;
        LOG_ERROR("CommunicationManager: request " + correlation_id + " to " + request.tool_name +
                  " failed after " + std::to_string(outcome.attempts) + " attempt(s) in " +
                  std::to_string(duration_ms) + "ms: " + error);
        publish(protocol::EventType::RequestFailed, std::move(data));
    } else {
        LOG_INFO("CommunicationManager: request " + correlation_id + " to " + request.tool_name +
                 " completed in " + std::to_string(duration_ms) + "ms");
        publish(protocol::EventType::RequestCompleted, std::move(data));
    }
    return std::move(outcome.result);
}

CommunicationManager::Attempted CommunicationManager::send_with_retry(
    const ExecutionContext& ctx, const CommunicationRequest& request) {
    const int max_attempts = static_cast<int>(settings_.max_retries) + 1;
    Attempted outcome{EngineError{ErrorCategory::Internal, "Request was never attempted.",
                                  "request_not_attempted"},
                      0};

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        outcome.attempts = attempt;
        outcome.result = dispatcher_.dispatch(ctx, request.tool_name, request.input);
        if (!core::errors::is_error(outcome.result)) {
            // A tool-level failure is a payload, not a transport problem.
            return outcome;
        }

        const EngineError& error = core::errors::get_error(outcome.result);
        if (!is_retryable(error) || attempt == max_attempts) {
            return outcome;
        }

        const auto delay = backoff_delay(attempt);
        LOG_WARN("CommunicationManager: retrying " + request.tool_name + " (request " +
                 request.correlation_id + ", attempt " + std::to_string(attempt + 1) + "/" +
                 std::to_string(max_attempts) + ") in " + std::to_string(delay.count()) +
                 "ms: " + error.message);
        if (!ctx.sleep_for(delay)) {
            outcome.result = EngineError{ErrorCategory::Timeout,
                                         "Retry wait for " + request.tool_name +
                                             " interrupted: " + error.message,
                                         "retry_wait_interrupted"};
            return outcome;
        }
    }
    return outcome;
}

void CommunicationManager::open_correlation(const CommunicationRequest& request) {
    RequestCorrelation correlation;
    correlation.id = request.correlation_id;
    correlation.root_request_id = request.correlation_id;
    correlation.parent_id = request.parent_id;
    correlation.session_id = request.session_id;
    correlation.start_time = std::chrono::system_clock::now();

    std::unique_lock<std::shared_mutex> lock(correlations_mutex_);
    if (request.parent_id.has_value()) {
        const auto parent = correlations_.find(request.parent_id.value());
        if (parent != correlations_.end()) {
            correlation.root_request_id = parent->second.root_request_id;
            correlation.tool_chain = parent->second.tool_chain;
        } else {
            LOG_DEBUG("CommunicationManager: parent correlation " + request.parent_id.value() +
                      " not tracked, starting new chain");
        }
    }
    correlation.tool_chain.push_back(request.tool_name);

    if (correlations_.find(correlation.id) == correlations_.end()) {
        correlation_order_.push_back(correlation.id);
    }
    correlations_[correlation.id] = std::move(correlation);
    evict_correlations_locked();
}

void CommunicationManager::close_correlation(const std::string& correlation_id,
                                             const CorrelationStatus status, const int attempts) {
    std::unique_lock<std::shared_mutex> lock(correlations_mutex_);
    const auto it = correlations_.find(correlation_id);
    if (it == correlations_.end()) {
        return;
    }
    it->second.status = status;
    it->second.attempts = attempts;
    it->second.end_time = std::chrono::system_clock::now();
}

void CommunicationManager::evict_correlations_locked() {
    auto it = correlation_order_.begin();
    while (correlations_.size() > settings_.max_correlations && it != correlation_order_.end()) {
        const auto found = correlations_.find(*it);
        if (found == correlations_.end()) {
            it = correlation_order_.erase(it);
            continue;
        }
        if (found->second.status != CorrelationStatus::Pending) {
            correlations_.erase(found);
            it = correlation_order_.erase(it);
            continue;
        }
        ++it;
    }
}

std::shared_ptr<RequestMetrics> CommunicationManager::metrics_for(const std::string& tool_name) {
    {
        std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
        const auto it = metrics_.find(tool_name);
        if (it != metrics_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
    auto& slot = metrics_[tool_name];
    if (!slot) {
        slot = std::make_shared<RequestMetrics>(tool_name, settings_.latency_window);
    }
    return slot;
}

std::optional<RequestCorrelation> CommunicationManager::get_correlation(
    const std::string& correlation_id) const {
    std::shared_lock<std::shared_mutex> lock(correlations_mutex_);
    const auto it = correlations_.find(correlation_id);
    if (it == correlations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RequestMetricsSnapshot> CommunicationManager::get_metrics(
    const std::string& tool_name) const {
    std::shared_ptr<RequestMetrics> metrics;
    {
        std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
        const auto it = metrics_.find(tool_name);
        if (it == metrics_.end()) {
            return std::nullopt;
        }
        metrics = it->second;
    }
    return metrics->snapshot();
}

std::vector<RequestMetricsSnapshot> CommunicationManager::all_metrics() const {
    std::vector<std::shared_ptr<RequestMetrics>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
        entries.reserve(metrics_.size());
        for (const auto& entry : metrics_) {
            entries.push_back(entry.second);
        }
    }
    std::vector<RequestMetricsSnapshot> snapshots;
    snapshots.reserve(entries.size());
    for (const auto& metrics : entries) {
        snapshots.push_back(metrics->snapshot());
    }
    return snapshots;
}

std::vector<CircuitBreakerSnapshot> CommunicationManager::circuit_breakers() const {
    return breakers_.snapshots();
}

core::errors::Status CommunicationManager::reset_circuit_breaker(const std::string& tool_name) {
    return breakers_.reset(tool_name);
}

std::size_t CommunicationManager::correlation_count() const {
    std::shared_lock<std::shared_mutex> lock(correlations_mutex_);
    return correlations_.size();
}

void CommunicationManager::publish(const protocol::EventType type, nlohmann::json data) const {
    if (event_bus_ != nullptr) {
        event_bus_->publish(type, std::move(data));
    }
}

}  // namespace conduit::resilience
