#include "events/event_bus.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace conduit::events {

using protocol::Event;
using protocol::EventType;

EventBus::EventBus(core::config::EventBusSettings settings)
    : settings_(std::move(settings)),
      root_context_(core::context::ExecutionContext::background()),
      queue_(std::max<std::size_t>(1, settings_.buffer_size)),
      workers_("event-bus") {
    workers_.start(std::max<std::size_t>(1, settings_.worker_count),
                   [this](std::size_t index) { worker_loop(index); });
    LOG_INFO("EventBus: started with buffer " + std::to_string(queue_.capacity()) +
             ", history " + std::to_string(settings_.max_history));
}

EventBus::~EventBus() {
    close();
}

void EventBus::publish(const EventType type, nlohmann::json data) {
    if (closed_.load()) {
        LOG_WARN("EventBus: publish of " + protocol::to_string(type) + " ignored, bus is closed");
        return;
    }

    Event event;
    event.id = core::config::generate_id("evt");
    event.type = type;
    event.source = settings_.source;
    event.timestamp = std::chrono::system_clock::now();
    const auto session = data.find("session_id");
    if (session != data.end() && session->is_string()) {
        event.session_id = session->get<std::string>();
    }
    event.data = std::move(data);

    record_history(event);
    published_.fetch_add(1);

    switch (queue_.try_push(event)) {
        case core::concurrency::PushResult::Accepted:
            break;
        case core::concurrency::PushResult::Full:
            dropped_.fetch_add(1);
            LOG_WARN("EventBus: queue full, dropped event " + event.id + " (" +
                     protocol::to_string(type) + ")");
            break;
        case core::concurrency::PushResult::Closed:
            LOG_WARN("EventBus: bus closed, event " + event.id + " (" +
                     protocol::to_string(type) + ") not delivered");
            break;
    }
}

void EventBus::record_history(const Event& event) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(event);
    while (history_.size() > settings_.max_history) {
        history_.pop_front();
    }
}

std::string EventBus::subscribe(const EventType type, EventHandler handler) {
    auto subscription = std::make_shared<Subscription>();
    subscription->id = core::config::generate_id("sub");
    subscription->type = type;
    subscription->handler = std::move(handler);
    const std::string id = subscription->id;

    {
        std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
        subscriptions_[type].push_back(std::move(subscription));
    }
    LOG_DEBUG("EventBus: subscription " + id + " added for " + protocol::to_string(type));
    return id;
}

bool EventBus::unsubscribe(const std::string& subscription_id) {
    std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
    for (auto& bucket : subscriptions_) {
        auto& list = bucket.second;
        const auto it = std::find_if(list.begin(), list.end(),
                                     [&subscription_id](const std::shared_ptr<Subscription>& sub) {
                                         return sub->id == subscription_id;
                                     });
        if (it == list.end()) {
            continue;
        }
        (*it)->active.store(false);
        list.erase(it);
        LOG_DEBUG("EventBus: subscription " + subscription_id + " removed");
        return true;
    }
    return false;
}

std::vector<Event> EventBus::get_event_history(const std::size_t limit) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    std::size_t start = 0;
    if (limit > 0 && limit < history_.size()) {
        start = history_.size() - limit;
    }
    return std::vector<Event>(history_.begin() + static_cast<std::ptrdiff_t>(start),
                              history_.end());
}

std::map<EventType, SubscriptionStats> EventBus::get_subscription_stats() const {
    std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
    std::map<EventType, SubscriptionStats> stats;
    for (const auto& bucket : subscriptions_) {
        SubscriptionStats entry;
        for (const auto& sub : bucket.second) {
            if (sub->active.load()) {
                ++entry.subscriptions;
            }
            entry.handled += sub->handled.load();
            entry.errors += sub->errors.load();
        }
        stats[bucket.first] = entry;
    }
    return stats;
}

void EventBus::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.exchange(true)) {
        return;
    }
    queue_.close();
    workers_.join();
    root_context_.cancel();
    LOG_INFO("EventBus: closed after " + std::to_string(published_.load()) + " events (" +
             std::to_string(dropped_.load()) + " dropped)");
}

void EventBus::worker_loop(std::size_t) {
    while (true) {
        auto event = queue_.pop();
        if (!event.has_value()) {
            return;
        }
        dispatch(event.value());
    }
}

void EventBus::dispatch(const Event& event) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
        const auto it = subscriptions_.find(event.type);
        if (it == subscriptions_.end()) {
            return;
        }
        targets = it->second;
    }

    for (const auto& subscription : targets) {
        if (subscription->active.load()) {
            invoke(*subscription, event);
        }
    }
}

void EventBus::invoke(Subscription& subscription, const Event& event) {
    const auto ctx = root_context_.with_timeout(settings_.handler_timeout);
    std::string failure;
    try {
        const auto status = subscription.handler(event, ctx);
        if (core::errors::is_error(status)) {
            failure = core::errors::describe(core::errors::get_error(status));
        } else if (ctx.deadline_exceeded()) {
            failure = "handler exceeded timeout of " +
                      std::to_string(settings_.handler_timeout.count()) + "ms";
        }
    } catch (const std::exception& ex) {
        failure = std::string("handler threw: ") + ex.what();
    }

    if (failure.empty()) {
        subscription.handled.fetch_add(1);
        return;
    }
    subscription.errors.fetch_add(1);
    LOG_ERROR("EventBus: subscription " + subscription.id + " failed on " +
              protocol::to_string(event.type) + " event " + event.id + ": " + failure);
}

}  // namespace conduit::events
