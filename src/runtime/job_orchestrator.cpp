#include "runtime/job_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <utility>
#include <variant>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace conduit::runtime {

using core::context::ExecutionContext;
using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::Job;
using protocol::JobPayload;
using protocol::JobStatus;

namespace {

constexpr int kMaxIdAttempts = 16;

// Routes a parsed payload to the handler slot of its kind.
struct HandlerVisitor {
    const JobHandlers& handlers;
    const ExecutionContext& ctx;

    core::errors::Result<nlohmann::json> operator()(const protocol::AnalysisJob& job) const {
        if (!handlers.analysis) {
            return nlohmann::json();
        }
        return handlers.analysis(job, ctx);
    }

    core::errors::Result<nlohmann::json> operator()(const protocol::BuildJob& job) const {
        if (!handlers.build) {
            return nlohmann::json();
        }
        return handlers.build(job, ctx);
    }

    core::errors::Result<nlohmann::json> operator()(const protocol::DeployJob& job) const {
        if (!handlers.deploy) {
            return nlohmann::json();
        }
        return handlers.deploy(job, ctx);
    }

    core::errors::Result<nlohmann::json> operator()(const protocol::UnknownJob& job) const {
        LOG_DEBUG("JobOrchestrator: no handler for job type '" + job.type + "', skipping");
        return nlohmann::json();
    }
};

}  // namespace

JobOrchestrator::JobOrchestrator(core::config::JobSettings settings, events::EventBus* event_bus)
    : settings_(settings),
      event_bus_(event_bus),
      queue_(std::max<std::size_t>(1, settings.queue_capacity)),
      workers_("job-orchestrator"),
      root_context_(ExecutionContext::background()) {}

JobOrchestrator::~JobOrchestrator() {
    stop();
}

bool JobOrchestrator::is_valid_transition(const JobStatus from, const JobStatus to) {
    switch (from) {
        case JobStatus::Pending:
            // Pending -> Failed covers a job rejected by a full queue.
            return to == JobStatus::Running || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        case JobStatus::Running:
            return to == JobStatus::Completed || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        default:
            return false;
    }
}

core::errors::Status JobOrchestrator::set_handlers(JobHandlers handlers) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_.load()) {
        return EngineError{ErrorCategory::Validation,
                           "Job handlers must be set before the orchestrator starts.",
                           "job_orchestrator_running"};
    }
    handlers_ = std::move(handlers);
    return core::errors::ok();
}

void JobOrchestrator::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_.load() || stopped_.load()) {
        return;
    }
    started_.store(true);
    workers_.start(std::max<std::size_t>(1, settings_.worker_count),
                   [this](std::size_t index) { worker_loop(index); });
    LOG_INFO("JobOrchestrator: started " + std::to_string(workers_.size()) +
             " workers, queue capacity " + std::to_string(queue_.capacity()));
}

void JobOrchestrator::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_.exchange(true)) {
        return;
    }
    queue_.close();
    root_context_.cancel();
    workers_.join();

    std::vector<std::string> cancelled;
    {
        std::unique_lock<std::shared_mutex> jobs_lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        for (auto& entry : jobs_) {
            JobRecord& record = entry.second;
            if (record.job.status != JobStatus::Pending) {
                continue;
            }
            auto moved = transition_locked(record, JobStatus::Cancelled);
            if (!core::errors::is_error(moved)) {
                record.job.completed_at = now;
                record.job.error = "job orchestrator stopped";
                cancelled.push_back(entry.first);
            }
        }
    }
    for (const auto& job_id : cancelled) {
        publish(protocol::EventType::JobCancelled, {{"job_id", job_id}, {"reason", "stopped"}});
    }
    LOG_INFO("JobOrchestrator: stopped (" + std::to_string(cancelled.size()) +
             " pending jobs cancelled)");
}

core::errors::Result<std::string> JobOrchestrator::submit_job(Job job) {
    if (stopped_.load()) {
        return EngineError{ErrorCategory::Overload, "Job orchestrator is stopped.",
                           "job_orchestrator_stopped"};
    }

    auto payload = protocol::parse_job_payload(job.type, job.parameters);
    if (core::errors::is_error(payload)) {
        LOG_WARN("JobOrchestrator: rejected " + job.type + " job: " +
                 core::errors::get_error(payload).message);
        return core::errors::get_error(payload);
    }

    JobRecord record;
    record.payload = std::move(core::errors::get_value(payload));
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    record.job = std::move(job);
    record.job.status = JobStatus::Pending;
    record.job.created_at = std::chrono::system_clock::now();
    record.job.started_at.reset();
    record.job.completed_at.reset();
    record.job.result = nullptr;
    record.job.error.clear();

    std::string job_id;
    std::string job_type;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (record.job.id.empty()) {
            for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
                const std::string candidate = core::config::generate_id("job");
                if (jobs_.find(candidate) == jobs_.end()) {
                    record.job.id = candidate;
                    break;
                }
            }
            if (record.job.id.empty()) {
                return EngineError{ErrorCategory::Internal, "Unable to allocate unique job ID.",
                                   "job_id_generation_failed"};
            }
        } else if (jobs_.find(record.job.id) != jobs_.end()) {
            return EngineError{ErrorCategory::Validation,
                               "Job ID already exists: " + record.job.id, "duplicate_job_id"};
        }

        job_id = record.job.id;
        job_type = record.job.type;
        jobs_.emplace(job_id, std::move(record));
        submission_order_.push_back(job_id);
        evict_terminal_locked();
    }

    LOG_INFO("JobOrchestrator: job " + job_id + " submitted (" + job_type + ")");
    publish(protocol::EventType::JobSubmitted, {{"job_id", job_id}, {"type", job_type}});
    const auto pushed = queue_.try_push(job_id);
    if (pushed == core::concurrency::PushResult::Accepted) {
        return job_id;
    }
    if (pushed == core::concurrency::PushResult::Closed) {
        // stop() closed the queue after the check above.
        bool cancelled = false;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = jobs_.find(job_id);
            if (it != jobs_.end()) {
                auto moved = transition_locked(it->second, JobStatus::Cancelled);
                if (!core::errors::is_error(moved)) {
                    it->second.job.error = "job orchestrator stopped";
                    it->second.job.completed_at = std::chrono::system_clock::now();
                    cancelled = true;
                }
            }
        }
        if (cancelled) {
            publish(protocol::EventType::JobCancelled, {{"job_id", job_id}, {"reason", "stopped"}});
        }
        return EngineError{ErrorCategory::Overload, "Job orchestrator is stopped.",
                           "job_orchestrator_stopped"};
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it != jobs_.end()) {
            auto moved = transition_locked(it->second, JobStatus::Failed);
            if (!core::errors::is_error(moved)) {
                it->second.job.error = "job queue is full";
                it->second.job.completed_at = std::chrono::system_clock::now();
            }
        }
    }
    LOG_WARN("JobOrchestrator: queue full, job " + job_id + " marked failed");
    publish(protocol::EventType::JobFailed, {{"job_id", job_id}, {"error", "job queue is full"}});
    return job_id;
}

std::optional<Job> JobOrchestrator::get_job(const std::string& job_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.job;
}

std::vector<Job> JobOrchestrator::list_jobs(const std::optional<JobStatus> status) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Job> jobs;
    for (const auto& job_id : submission_order_) {
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            continue;
        }
        if (!status.has_value() || it->second.job.status == status.value()) {
            jobs.push_back(it->second.job);
        }
    }
    return jobs;
}

core::errors::Status JobOrchestrator::cancel_job(const std::string& job_id) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return EngineError{ErrorCategory::NotFound, "Job not found: " + job_id,
                               "job_not_found"};
        }

        auto moved = transition_locked(it->second, JobStatus::Cancelled);
        if (core::errors::is_error(moved)) {
            return core::errors::get_error(moved);
        }
        it->second.job.completed_at = std::chrono::system_clock::now();
        it->second.cancel_token->store(true);
    }
    publish(protocol::EventType::JobCancelled, {{"job_id", job_id}});
    return core::errors::ok();
}

protocol::OrchestratorStats JobOrchestrator::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    protocol::OrchestratorStats stats;
    stats.total = jobs_.size();
    for (const auto& entry : jobs_) {
        switch (entry.second.job.status) {
            case JobStatus::Pending:
                ++stats.pending;
                break;
            case JobStatus::Running:
                ++stats.running;
                break;
            case JobStatus::Completed:
                ++stats.completed;
                break;
            case JobStatus::Failed:
                ++stats.failed;
                break;
            case JobStatus::Cancelled:
                ++stats.cancelled;
                break;
        }
    }
    return stats;
}

void JobOrchestrator::worker_loop(std::size_t) {
    while (true) {
        auto job_id = queue_.pop();
        if (!job_id.has_value() || stopped_.load()) {
            return;
        }
        process(job_id.value());
    }
}

void JobOrchestrator::process(const std::string& job_id) {
    JobPayload payload;
    core::context::CancelToken token;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return;
        }
        JobRecord& record = it->second;
        if (record.job.status != JobStatus::Pending) {
            LOG_DEBUG("JobOrchestrator: skipping job " + job_id + " in state " +
                      protocol::to_string(record.job.status));
            return;
        }
        auto moved = transition_locked(record, JobStatus::Running);
        if (core::errors::is_error(moved)) {
            return;
        }
        record.job.started_at = std::chrono::system_clock::now();
        payload = record.payload;
        token = record.cancel_token;
    }
    publish(protocol::EventType::JobStarted, {{"job_id", job_id}});

    const ExecutionContext job_ctx =
        root_context_.with_token(token).with_timeout(settings_.job_timeout);

    core::errors::Result<nlohmann::json> outcome = nlohmann::json();
    try {
        outcome = run_handler(payload, job_ctx);
    } catch (const std::exception& ex) {
        outcome = EngineError{ErrorCategory::Internal,
                              std::string("Job handler threw: ") + ex.what(),
                              "job_handler_exception"};
    }
    finish(job_id, std::move(outcome));
}

core::errors::Result<nlohmann::json> JobOrchestrator::run_handler(
    const JobPayload& payload, const ExecutionContext& ctx) const {
    return std::visit(HandlerVisitor{handlers_, ctx}, payload);
}

void JobOrchestrator::finish(const std::string& job_id,
                             core::errors::Result<nlohmann::json> outcome) {
    const bool failed = core::errors::is_error(outcome);
    const JobStatus next = failed ? JobStatus::Failed : JobStatus::Completed;
    double duration_ms = 0.0;
    std::string error;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return;
        }
        JobRecord& record = it->second;
        auto moved = transition_locked(record, next);
        if (core::errors::is_error(moved)) {
            // Cancelled while the handler ran; the terminal state stands.
            LOG_INFO("JobOrchestrator: job " + job_id + " finished after reaching " +
                     protocol::to_string(record.job.status) + ", outcome discarded");
            return;
        }

        const auto now = std::chrono::system_clock::now();
        record.job.completed_at = now;
        if (failed) {
            error = core::errors::describe(core::errors::get_error(outcome));
            record.job.error = error;
        } else {
            record.job.result = std::move(core::errors::get_value(outcome));
        }
        if (record.job.started_at.has_value()) {
            duration_ms = std::chrono::duration<double, std::milli>(
                              now - record.job.started_at.value())
                              .count();
        }
    }

    if (failed) {
        publish(protocol::EventType::JobFailed, {{"job_id", job_id}, {"error", error}});
    } else {
        publish(protocol::EventType::JobCompleted,
                {{"job_id", job_id}, {"duration_ms", duration_ms}});
    }
}

core::errors::Result<JobStatus> JobOrchestrator::transition_locked(JobRecord& record,
                                                                   const JobStatus next) {
    const JobStatus current = record.job.status;
    if (!is_valid_transition(current, next)) {
        return EngineError{ErrorCategory::Validation,
                           "Job " + record.job.id + " cannot move from " +
                               protocol::to_string(current) + " to " +
                               protocol::to_string(next),
                           "invalid_state_transition"};
    }
    record.job.status = next;
    LOG_INFO("JobOrchestrator: job " + record.job.id + " transition " +
             protocol::to_string(current) + " -> " + protocol::to_string(next));
    return next;
}

void JobOrchestrator::evict_terminal_locked() {
    auto it = submission_order_.begin();
    while (jobs_.size() > settings_.max_retained_jobs && it != submission_order_.end()) {
        const auto found = jobs_.find(*it);
        if (found == jobs_.end()) {
            it = submission_order_.erase(it);
            continue;
        }
        if (protocol::is_terminal(found->second.job.status)) {
            LOG_DEBUG("JobOrchestrator: evicting retained job " + *it);
            jobs_.erase(found);
            it = submission_order_.erase(it);
            continue;
        }
        ++it;
    }
}

void JobOrchestrator::publish(const protocol::EventType type, nlohmann::json data) const {
    if (event_bus_ != nullptr) {
        event_bus_->publish(type, std::move(data));
    }
}

}  // namespace conduit::runtime
