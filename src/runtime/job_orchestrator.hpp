#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/concurrency/bounded_queue.hpp"
#include "core/concurrency/worker_pool.hpp"
#include "core/config/engine_config.hpp"
#include "core/context/execution_context.hpp"
#include "core/errors/engine_errors.hpp"
#include "events/event_bus.hpp"
#include "protocol/job_contract.hpp"

namespace conduit::runtime {

template <typename Payload>
using JobHandler = std::function<core::errors::Result<nlohmann::json>(
    const Payload& payload, const core::context::ExecutionContext& ctx)>;

// One typed slot per job kind. An empty slot makes that kind a no-op.
struct JobHandlers {
    JobHandler<protocol::AnalysisJob> analysis;
    JobHandler<protocol::BuildJob> build;
    JobHandler<protocol::DeployJob> deploy;
};

// Queued asynchronous execution of longer-running jobs on a fixed worker
// pool. Submission never blocks; a full queue fails the job instead.
class JobOrchestrator {
public:
    explicit JobOrchestrator(core::config::JobSettings settings = {},
                             events::EventBus* event_bus = nullptr);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Must be called before start().
    core::errors::Status set_handlers(JobHandlers handlers);
    void start();
    // Idempotent. Jobs still pending are cancelled.
    void stop();

    // Returns the job id. A full queue is not an error: the job is stored
    // as failed and its id returned.
    core::errors::Result<std::string> submit_job(protocol::Job job);

    std::optional<protocol::Job> get_job(const std::string& job_id) const;
    std::vector<protocol::Job> list_jobs(
        std::optional<protocol::JobStatus> status = std::nullopt) const;
    // Signals the job's context; a running handler is never preempted.
    core::errors::Status cancel_job(const std::string& job_id);
    protocol::OrchestratorStats get_stats() const;

    bool running() const { return started_.load() && !stopped_.load(); }

private:
    struct JobRecord {
        protocol::Job job;
        protocol::JobPayload payload;
        core::context::CancelToken cancel_token;
    };

    void worker_loop(std::size_t worker_index);
    void process(const std::string& job_id);
    core::errors::Result<nlohmann::json> run_handler(
        const protocol::JobPayload& payload, const core::context::ExecutionContext& ctx) const;
    void finish(const std::string& job_id, core::errors::Result<nlohmann::json> outcome);
    core::errors::Result<protocol::JobStatus> transition_locked(JobRecord& record,
                                                                protocol::JobStatus next);
    void evict_terminal_locked();
    void publish(protocol::EventType type, nlohmann::json data) const;

    static bool is_valid_transition(protocol::JobStatus from, protocol::JobStatus to);

    const core::config::JobSettings settings_;
    events::EventBus* event_bus_;
    JobHandlers handlers_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, JobRecord> jobs_;
    std::deque<std::string> submission_order_;

    core::concurrency::BoundedQueue<std::string> queue_;
    core::concurrency::WorkerPool workers_;
    core::context::ExecutionContext root_context_;

    std::mutex lifecycle_mutex_;
    std::atomic_bool started_{false};
    std::atomic_bool stopped_{false};
};

}  // namespace conduit::runtime
