#include "resilience/circuit_breaker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace conduit::resilience {

using core::errors::EngineError;
using core::errors::ErrorCategory;

std::string to_string(const CircuitState state) {
    switch (state) {
        case CircuitState::Closed:
            return "closed";
        case CircuitState::Open:
            return "open";
        case CircuitState::HalfOpen:
            return "half_open";
        default:
            return "unknown";
    }
}

CircuitBreaker::CircuitBreaker(std::string name, const std::size_t max_failures,
                               const std::chrono::milliseconds reset_timeout)
    : name_(std::move(name)),
      max_failures_(max_failures == 0 ? 1 : max_failures),
      reset_timeout_(reset_timeout) {}

void CircuitBreaker::transition(const CircuitState next) {
    const std::string prev = to_string(state_);
    state_ = next;
    LOG_INFO("CircuitBreaker: " + name_ + " transition " + prev + " -> " + to_string(next) +
             " (failures=" + std::to_string(failure_count_) + ")");
}

bool CircuitBreaker::allow() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
        case CircuitState::HalfOpen:
            return true;
        case CircuitState::Open: {
            const auto since = last_failure_time_.value_or(BreakerClock::time_point{});
            if (BreakerClock::now() - since >= reset_timeout_) {
                transition(CircuitState::HalfOpen);
                return true;
            }
            return false;
        }
        default:
            return false;
    }
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_ = 0;
    if (state_ == CircuitState::HalfOpen) {
        transition(CircuitState::Closed);
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failure_count_;
    last_failure_time_ = BreakerClock::now();

    if (state_ == CircuitState::HalfOpen) {
        transition(CircuitState::Open);
        return;
    }
    if (state_ == CircuitState::Closed && failure_count_ >= max_failures_) {
        transition(CircuitState::Open);
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_ = 0;
    last_failure_time_.reset();
    if (state_ != CircuitState::Closed) {
        // Manual override, the one path that may skip half_open.
        transition(CircuitState::Closed);
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerSnapshot snap;
    snap.name = name_;
    snap.state = state_;
    snap.failure_count = failure_count_;
    snap.max_failures = max_failures_;
    snap.reset_timeout = reset_timeout_;
    snap.last_failure_time = last_failure_time_;
    return snap;
}

CircuitBreakerRegistry::CircuitBreakerRegistry(const std::size_t max_failures,
                                               const std::chrono::milliseconds reset_timeout,
                                               const std::size_t max_breakers)
    : max_failures_(max_failures),
      reset_timeout_(reset_timeout),
      max_breakers_(max_breakers == 0 ? 1 : max_breakers) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_or_create(const std::string& name) {
    if (auto existing = find(name)) {
        return existing;
    }

    std::shared_ptr<CircuitBreaker> breaker;
    bool over_capacity = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = breakers_[name];
        if (!slot) {
            slot = std::make_shared<CircuitBreaker>(name, max_failures_, reset_timeout_);
            LOG_DEBUG("CircuitBreakerRegistry: created breaker for " + name);
        }
        breaker = slot;
        over_capacity = breakers_.size() > max_breakers_;
    }

    if (over_capacity) {
        evict_idle(name);
    }
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = breakers_.find(name);
    if (it == breakers_.end()) {
        return nullptr;
    }
    return it->second;
}

core::errors::Status CircuitBreakerRegistry::reset(const std::string& name) {
    auto breaker = find(name);
    if (!breaker) {
        return EngineError{ErrorCategory::NotFound, "No circuit breaker for tool: " + name,
                           "circuit_breaker_not_found"};
    }
    breaker->reset();
    return core::errors::ok();
}

std::vector<CircuitBreakerSnapshot> CircuitBreakerRegistry::snapshots() const {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        breakers.reserve(breakers_.size());
        for (const auto& entry : breakers_) {
            breakers.push_back(entry.second);
        }
    }

    std::vector<CircuitBreakerSnapshot> result;
    result.reserve(breakers.size());
    for (const auto& breaker : breakers) {
        result.push_back(breaker->snapshot());
    }
    return result;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return breakers_.size();
}

void CircuitBreakerRegistry::evict_idle(const std::string& keep) {
    // Breaker state is read without the registry lock held.
    std::vector<std::string> idle;
    for (const auto& snap : snapshots()) {
        if (snap.name != keep && snap.state == CircuitState::Closed &&
            snap.failure_count == 0) {
            idle.push_back(snap.name);
        }
    }

    std::size_t evicted = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& name : idle) {
            if (breakers_.size() <= max_breakers_) {
                break;
            }
            evicted += breakers_.erase(name);
        }
    }
    if (evicted > 0) {
        LOG_DEBUG("CircuitBreakerRegistry: evicted " + std::to_string(evicted) + " idle breakers");
    }
}

}  // namespace conduit::resilience
