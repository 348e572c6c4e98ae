#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/engine_errors.hpp"

namespace conduit::resilience {

using BreakerClock = std::chrono::steady_clock;

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string to_string(CircuitState state);

struct CircuitBreakerSnapshot {
    std::string name;
    CircuitState state = CircuitState::Closed;
    std::size_t failure_count = 0;
    std::size_t max_failures = 0;
    std::chrono::milliseconds reset_timeout{0};
    std::optional<BreakerClock::time_point> last_failure_time;
};

// Failure-isolation state machine for a single tool.
//
// closed    -> allow() always true; max_failures consecutive failures open it.
// open      -> allow() false until reset_timeout has passed since the last
//              failure, then the breaker moves to half_open and lets one
//              trial request through.
// half_open -> the next outcome decides: success closes it, failure reopens it.
class CircuitBreaker {
public:
    CircuitBreaker(std::string name, std::size_t max_failures,
                   std::chrono::milliseconds reset_timeout);

    bool allow();
    void record_success();
    void record_failure();
    // Operator override back to closed with a clean failure count.
    void reset();

    CircuitState state() const;
    std::size_t failure_count() const;
    CircuitBreakerSnapshot snapshot() const;
    const std::string& name() const { return name_; }

private:
    void transition(CircuitState next);

    const std::string name_;
    const std::size_t max_failures_;
    const std::chrono::milliseconds reset_timeout_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    std::size_t failure_count_ = 0;
    std::optional<BreakerClock::time_point> last_failure_time_;
};

// Lazily creates one breaker per tool name. Idle breakers (closed, no
// failures) are evicted once max_breakers is exceeded.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(std::size_t max_failures, std::chrono::milliseconds reset_timeout,
                           std::size_t max_breakers);

    std::shared_ptr<CircuitBreaker> get_or_create(const std::string& name);
    std::shared_ptr<CircuitBreaker> find(const std::string& name) const;
    core::errors::Status reset(const std::string& name);
    std::vector<CircuitBreakerSnapshot> snapshots() const;
    std::size_t size() const;

private:
    // Never evicts `keep`, the breaker the caller is about to use.
    void evict_idle(const std::string& keep);

    const std::size_t max_failures_;
    const std::chrono::milliseconds reset_timeout_;
    const std::size_t max_breakers_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace conduit::resilience
