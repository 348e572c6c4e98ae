#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace conduit::core::context {

using Clock = std::chrono::steady_clock;
using CancelToken = std::shared_ptr<std::atomic_bool>;

// Cooperative cancellation scope handed to tools, job handlers and event
// handlers. Copies share tokens; derived contexts add a token of their own
// and still observe every ancestor token.
class ExecutionContext {
public:
    static ExecutionContext background();

    // Child scope whose deadline is the earlier of the current one and now + timeout.
    ExecutionContext with_timeout(Clock::duration timeout) const;
    ExecutionContext with_deadline(Clock::time_point deadline) const;
    // Child scope that can be cancelled without affecting this one.
    ExecutionContext with_cancel() const;
    // Child scope that also observes an externally owned token.
    ExecutionContext with_token(CancelToken token) const;

    // Cancels this scope (its own token) and every scope derived from it.
    void cancel() const;

    bool is_cancelled() const;
    bool token_cancelled() const;
    bool deadline_exceeded() const;
    bool has_deadline() const { return deadline_.has_value(); }
    std::optional<Clock::time_point> deadline() const { return deadline_; }
    // Time left before the deadline; nullopt when there is none.
    std::optional<Clock::duration> remaining() const;

    // Sleeps for the duration unless the scope is cancelled or its deadline
    // passes first. Returns true when the full duration elapsed.
    bool sleep_for(Clock::duration duration) const;

    const CancelToken& token() const { return tokens_.back(); }

private:
    ExecutionContext();

    std::vector<CancelToken> tokens_;
    std::optional<Clock::time_point> deadline_;
};

}  // namespace conduit::core::context
