#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace conduit::core::concurrency {

// Fixed set of threads running the same body. The body receives its worker
// index and is expected to return once its input source is closed.
class WorkerPool {
public:
    using WorkerBody = std::function<void(std::size_t worker_index)>;

    explicit WorkerPool(std::string name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Ignored when the pool is already running.
    void start(std::size_t worker_count, const WorkerBody& body);
    // Waits for every worker to return. Safe to call repeatedly.
    void join();

    bool running() const { return !threads_.empty(); }
    std::size_t size() const { return threads_.size(); }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<std::thread> threads_;
};

}  // namespace conduit::core::concurrency
