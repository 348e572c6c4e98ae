#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/concurrency/bounded_queue.hpp"
#include "core/concurrency/worker_pool.hpp"
#include "core/config/engine_config.hpp"
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "protocol/event_contract.hpp"

namespace conduit::events {

// Handlers receive a context bounded by the configured handler timeout.
// A returned error only affects the subscription's error count.
using EventHandler = std::function<core::errors::Status(
    const protocol::Event& event, const core::context::ExecutionContext& ctx)>;

struct SubscriptionStats {
    std::size_t subscriptions = 0;
    std::uint64_t handled = 0;
    std::uint64_t errors = 0;
};

// In-process publish/subscribe with bounded history and asynchronous
// delivery on a fixed worker pool. Publishing never blocks: when the
// delivery queue is full the event is dropped (it is still kept in history).
class EventBus {
public:
    explicit EventBus(core::config::EventBusSettings settings = {});
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void publish(protocol::EventType type, nlohmann::json data = nlohmann::json::object());

    std::string subscribe(protocol::EventType type, EventHandler handler);
    // Deactivates and removes the subscription. False if the id is unknown.
    bool unsubscribe(const std::string& subscription_id);

    // Most recent events, oldest first. limit == 0 returns the whole history.
    std::vector<protocol::Event> get_event_history(std::size_t limit = 0) const;
    std::map<protocol::EventType, SubscriptionStats> get_subscription_stats() const;

    std::uint64_t published_events() const { return published_.load(); }
    std::uint64_t dropped_events() const { return dropped_.load(); }

    // Stops accepting events, lets the workers drain the queue and joins
    // them. Idempotent.
    void close();
    bool closed() const { return closed_.load(); }

private:
    struct Subscription {
        std::string id;
        protocol::EventType type;
        EventHandler handler;
        std::atomic_bool active{true};
        std::atomic<std::uint64_t> handled{0};
        std::atomic<std::uint64_t> errors{0};
    };

    void worker_loop(std::size_t worker_index);
    void dispatch(const protocol::Event& event);
    void invoke(Subscription& subscription, const protocol::Event& event);
    void record_history(const protocol::Event& event);

    const core::config::EventBusSettings settings_;
    core::context::ExecutionContext root_context_;

    mutable std::shared_mutex subscriptions_mutex_;
    std::map<protocol::EventType, std::vector<std::shared_ptr<Subscription>>> subscriptions_;

    mutable std::mutex history_mutex_;
    std::deque<protocol::Event> history_;

    core::concurrency::BoundedQueue<protocol::Event> queue_;
    core::concurrency::WorkerPool workers_;

    std::mutex close_mutex_;
    std::atomic_bool closed_{false};
    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace conduit::events
