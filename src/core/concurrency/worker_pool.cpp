#include "core/concurrency/worker_pool.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace conduit::core::concurrency {

WorkerPool::WorkerPool(std::string name) : name_(std::move(name)) {}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::start(const std::size_t worker_count, const WorkerBody& body) {
    if (!threads_.empty()) {
        LOG_WARN("WorkerPool " + name_ + ": already running, start ignored");
        return;
    }

    threads_.reserve(worker_count);
    for (std::size_t index = 0; index < worker_count; ++index) {
        threads_.emplace_back([this, body, index]() {
            LOG_DEBUG("WorkerPool " + name_ + ": worker " + std::to_string(index) + " started");
            try {
                body(index);
            } catch (const std::exception& ex) {
                LOG_ERROR("WorkerPool " + name_ + ": worker " + std::to_string(index) +
                          " terminated by exception: " + ex.what());
            }
            LOG_DEBUG("WorkerPool " + name_ + ": worker " + std::to_string(index) + " exited");
        });
    }
    LOG_INFO("WorkerPool " + name_ + ": started " + std::to_string(worker_count) + " workers");
}

void WorkerPool::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

}  // namespace conduit::core::concurrency
