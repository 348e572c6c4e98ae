#include "core/context/execution_context.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace conduit::core::context {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(5);

}  // namespace

ExecutionContext::ExecutionContext()
    : tokens_{std::make_shared<std::atomic_bool>(false)} {}

ExecutionContext ExecutionContext::background() {
    return ExecutionContext();
}

ExecutionContext ExecutionContext::with_timeout(const Clock::duration timeout) const {
    return with_deadline(Clock::now() + timeout);
}

ExecutionContext ExecutionContext::with_deadline(const Clock::time_point deadline) const {
    ExecutionContext child = with_cancel();
    if (!child.deadline_.has_value() || deadline < child.deadline_.value()) {
        child.deadline_ = deadline;
    }
    return child;
}

ExecutionContext ExecutionContext::with_cancel() const {
    ExecutionContext child = *this;
    child.tokens_.push_back(std::make_shared<std::atomic_bool>(false));
    return child;
}

ExecutionContext ExecutionContext::with_token(CancelToken token) const {
    ExecutionContext child = *this;
    if (token) {
        child.tokens_.insert(child.tokens_.end() - 1, std::move(token));
    }
    return child;
}

void ExecutionContext::cancel() const {
    tokens_.back()->store(true);
}

bool ExecutionContext::token_cancelled() const {
    return std::any_of(tokens_.begin(), tokens_.end(),
                       [](const CancelToken& token) { return token->load(); });
}

bool ExecutionContext::deadline_exceeded() const {
    return deadline_.has_value() && Clock::now() >= deadline_.value();
}

bool ExecutionContext::is_cancelled() const {
    return token_cancelled() || deadline_exceeded();
}

std::optional<Clock::duration> ExecutionContext::remaining() const {
    if (!deadline_.has_value()) {
        return std::nullopt;
    }
    const auto now = Clock::now();
    if (now >= deadline_.value()) {
        return Clock::duration::zero();
    }
    return deadline_.value() - now;
}

bool ExecutionContext::sleep_for(const Clock::duration duration) const {
    const auto wake_at = Clock::now() + duration;
    while (true) {
        if (is_cancelled()) {
            return false;
        }
        const auto now = Clock::now();
        if (now >= wake_at) {
            return true;
        }
        const Clock::duration slice = std::min<Clock::duration>(kSleepSlice, wake_at - now);
        std::this_thread::sleep_for(slice);
    }
}

}  // namespace conduit::core::context
