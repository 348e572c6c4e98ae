#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"
#include "events/event_bus.hpp"
#include "runtime/job_orchestrator.hpp"

namespace {

using conduit::core::config::JobSettings;
using conduit::core::context::ExecutionContext;
using conduit::core::errors::EngineError;
using conduit::core::errors::ErrorCategory;
using conduit::core::errors::get_error;
using conduit::core::errors::get_value;
using conduit::core::errors::is_error;
using conduit::core::errors::Result;
using conduit::protocol::AnalysisJob;
using conduit::protocol::BuildJob;
using conduit::protocol::EventType;
using conduit::protocol::Job;
using conduit::protocol::JobStatus;
using conduit::runtime::JobHandlers;
using conduit::runtime::JobOrchestrator;
using namespace std::chrono_literals;

Job make_job(const std::string& type, nlohmann::json parameters, const std::string& id = "") {
    Job job;
    job.id = id;
    job.type = type;
    job.parameters = std::move(parameters);
    return job;
}

Job analysis_job(const std::string& id = "") {
    return make_job("analysis", {{"repo_path", "/repo"}}, id);
}

bool wait_for_status(const JobOrchestrator& jobs, const std::string& id, JobStatus status,
                     std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        const auto job = jobs.get_job(id);
        if (job.has_value() && job->status == status) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

// Blocks until the job context ends, then reports why.
Result<nlohmann::json> wait_for_cancel(const ExecutionContext& ctx) {
    while (!ctx.is_cancelled()) {
        std::this_thread::sleep_for(1ms);
    }
    return EngineError{ErrorCategory::Timeout, "job context ended", "job_cancelled"};
}

class JobOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        conduit::core::logging::Logger::get().set_min_level(
            conduit::core::logging::LogLevel::ERROR);
    }
};

TEST_F(JobOrchestratorTest, RunsTypedHandlerToCompletion) {
    JobOrchestrator jobs;
    JobHandlers handlers;
    handlers.analysis = [](const AnalysisJob& job, const ExecutionContext&) -> Result<nlohmann::json> {
        return nlohmann::json{{"scanned", job.repo_path}};
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));
    jobs.start();

    auto submitted = jobs.submit_job(analysis_job());
    ASSERT_FALSE(is_error(submitted));
    const std::string id = get_value(submitted);
    EXPECT_EQ(id.rfind("job-", 0), 0u);

    ASSERT_TRUE(wait_for_status(jobs, id, JobStatus::Completed));
    const auto job = jobs.get_job(id).value();
    EXPECT_EQ(job.result["scanned"], "/repo");
    EXPECT_TRUE(job.started_at.has_value());
    EXPECT_TRUE(job.completed_at.has_value());
    EXPECT_TRUE(job.error.empty());
    jobs.stop();
}

TEST_F(JobOrchestratorTest, InvalidParametersAreRejectedAndNotStored) {
    JobOrchestrator jobs;
    auto submitted = jobs.submit_job(make_job("build", {{"dockerfile_path", "Dockerfile"}}));
    ASSERT_TRUE(is_error(submitted));
    EXPECT_EQ(get_error(submitted).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(submitted).code, "invalid_job_parameters");
    EXPECT_TRUE(jobs.list_jobs().empty());
}

TEST_F(JobOrchestratorTest, FullQueueFailsJobWithoutBlocking) {
    JobSettings settings;
    settings.queue_capacity = 1;
    JobOrchestrator jobs(settings);

    const auto started = std::chrono::steady_clock::now();
    auto first = jobs.submit_job(analysis_job());
    auto second = jobs.submit_job(analysis_job());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));

    EXPECT_EQ(jobs.get_job(get_value(first))->status, JobStatus::Pending);
    const auto rejected = jobs.get_job(get_value(second)).value();
    EXPECT_EQ(rejected.status, JobStatus::Failed);
    EXPECT_EQ(rejected.error, "job queue is full");
    EXPECT_TRUE(rejected.completed_at.has_value());

    const auto stats = jobs.get_stats();
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.pending, 1u);
    EXPECT_EQ(stats.failed, 1u);
}

TEST_F(JobOrchestratorTest, HandlerErrorsAndExceptionsFailTheJob) {
    JobOrchestrator jobs;
    JobHandlers handlers;
    handlers.analysis = [](const AnalysisJob&, const ExecutionContext&) -> Result<nlohmann::json> {
        return EngineError{ErrorCategory::Execution, "scanner crashed", "scan_failed"};
    };
    handlers.build = [](const BuildJob&, const ExecutionContext&) -> Result<nlohmann::json> {
        throw std::runtime_error("docker daemon gone");
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));
    jobs.start();

    const auto analysis = get_value(jobs.submit_job(analysis_job()));
    const auto build = get_value(jobs.submit_job(make_job("build", {{"image_name", "web"}})));

    ASSERT_TRUE(wait_for_status(jobs, analysis, JobStatus::Failed));
    ASSERT_TRUE(wait_for_status(jobs, build, JobStatus::Failed));
    EXPECT_EQ(jobs.get_job(analysis)->error, "[scan_failed] scanner crashed");
    EXPECT_NE(jobs.get_job(build)->error.find("docker daemon gone"), std::string::npos);
    jobs.stop();
}

TEST_F(JobOrchestratorTest, UnknownTypeCompletesAsNoOp) {
    JobOrchestrator jobs;
    jobs.start();
    const auto id = get_value(jobs.submit_job(make_job("cleanup", nlohmann::json::object())));
    ASSERT_TRUE(wait_for_status(jobs, id, JobStatus::Completed));
    EXPECT_TRUE(jobs.get_job(id)->result.is_null());
    jobs.stop();
}

TEST_F(JobOrchestratorTest, CancelledPendingJobIsSkipped) {
    std::atomic<int> runs{0};
    JobOrchestrator jobs;
    JobHandlers handlers;
    handlers.analysis = [&](const AnalysisJob&, const ExecutionContext&) -> Result<nlohmann::json> {
        runs.fetch_add(1);
        return nlohmann::json::object();
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));

    const auto id = get_value(jobs.submit_job(analysis_job()));
    ASSERT_FALSE(is_error(jobs.cancel_job(id)));
    EXPECT_EQ(jobs.get_job(id)->status, JobStatus::Cancelled);

    auto again = jobs.cancel_job(id);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
    auto unknown = jobs.cancel_job("job-missing");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).category, ErrorCategory::NotFound);

    jobs.start();
    const auto marker = get_value(jobs.submit_job(analysis_job()));
    ASSERT_TRUE(wait_for_status(jobs, marker, JobStatus::Completed));
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(jobs.get_job(id)->status, JobStatus::Cancelled);
    jobs.stop();
}

TEST_F(JobOrchestratorTest, CancellingRunningJobSignalsHandler) {
    std::atomic_bool entered{false};
    JobOrchestrator jobs;
    JobHandlers handlers;
    handlers.analysis = [&](const AnalysisJob&, const ExecutionContext& ctx) {
        entered.store(true);
        return wait_for_cancel(ctx);
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));
    jobs.start();

    const auto id = get_value(jobs.submit_job(analysis_job()));
    ASSERT_TRUE(wait_for_status(jobs, id, JobStatus::Running));
    ASSERT_FALSE(is_error(jobs.cancel_job(id)));

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(entered.load());
    EXPECT_EQ(jobs.get_job(id)->status, JobStatus::Cancelled);
    jobs.stop();
}

TEST_F(JobOrchestratorTest, LateSuccessDoesNotCompleteCancelledJob) {
    std::atomic_bool entered{false};
    std::atomic_bool release{false};
    conduit::events::EventBus bus;
    JobOrchestrator jobs({}, &bus);
    JobHandlers handlers;
    handlers.analysis = [&](const AnalysisJob&, const ExecutionContext&) -> Result<nlohmann::json> {
        entered.store(true);
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return nlohmann::json{{"finished", true}};
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));
    jobs.start();

    const auto id = get_value(jobs.submit_job(analysis_job()));
    ASSERT_TRUE(wait_for_status(jobs, id, JobStatus::Running));
    ASSERT_FALSE(is_error(jobs.cancel_job(id)));
    release.store(true);

    // stop() joins the worker, so the handler has returned by now.
    jobs.stop();
    EXPECT_TRUE(entered.load());
    const auto job = jobs.get_job(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Cancelled);
    EXPECT_TRUE(job->result.is_null());

    for (const auto& event : bus.get_event_history()) {
        if (event.data.value("job_id", "") == id) {
            EXPECT_NE(event.type, EventType::JobCompleted);
        }
    }
    bus.close();
}

TEST_F(JobOrchestratorTest, SubmitRacingStopNeverReportsQueueFull) {
    JobSettings settings;
    settings.worker_count = 2;
    settings.queue_capacity = 100000;
    settings.max_retained_jobs = 100000;
    JobOrchestrator jobs(settings);
    jobs.start();

    std::atomic_bool go{false};
    std::vector<std::vector<std::string>> accepted(4);
    std::vector<std::vector<std::string>> rejected(4);
    std::vector<std::thread> submitters;
    for (std::size_t t = 0; t < accepted.size(); ++t) {
        submitters.emplace_back([&, t] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < 500; ++i) {
                auto submitted = jobs.submit_job(analysis_job());
                if (is_error(submitted)) {
                    rejected[t].push_back(get_error(submitted).code);
                } else {
                    accepted[t].push_back(get_value(submitted));
                }
            }
        });
    }

    go.store(true);
    std::this_thread::sleep_for(2ms);
    jobs.stop();
    for (auto& submitter : submitters) {
        submitter.join();
    }

    for (std::size_t t = 0; t < accepted.size(); ++t) {
        for (const auto& code : rejected[t]) {
            EXPECT_EQ(code, "job_orchestrator_stopped");
        }
        for (const auto& id : accepted[t]) {
            const auto job = jobs.get_job(id);
            ASSERT_TRUE(job.has_value());
            EXPECT_NE(job->error, "job queue is full");
            EXPECT_TRUE(job->status == JobStatus::Completed || job->status == JobStatus::Cancelled)
                << id << " ended as " << conduit::protocol::to_string(job->status);
        }
    }
}

TEST_F(JobOrchestratorTest, JobTimeoutFailsLongHandler) {
    JobSettings settings;
    settings.job_timeout = 30ms;
    JobOrchestrator jobs(settings);
    JobHandlers handlers;
    handlers.analysis = [](const AnalysisJob&, const ExecutionContext& ctx) {
        return wait_for_cancel(ctx);
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));
    jobs.start();

    const auto id = get_value(jobs.submit_job(analysis_job()));
    ASSERT_TRUE(wait_for_status(jobs, id, JobStatus::Failed));
    jobs.stop();
}

TEST_F(JobOrchestratorTest, StopCancelsPendingJobsAndRejectsNewOnes) {
    JobSettings settings;
    settings.worker_count = 1;
    JobOrchestrator jobs(settings);
    JobHandlers handlers;
    handlers.analysis = [](const AnalysisJob&, const ExecutionContext& ctx) {
        return wait_for_cancel(ctx);
    };
    ASSERT_FALSE(is_error(jobs.set_handlers(handlers)));
    jobs.start();

    const auto running = get_value(jobs.submit_job(analysis_job()));
    ASSERT_TRUE(wait_for_status(jobs, running, JobStatus::Running));
    const auto queued_a = get_value(jobs.submit_job(analysis_job()));
    const auto queued_b = get_value(jobs.submit_job(analysis_job()));

    jobs.stop();
    jobs.stop();
    EXPECT_FALSE(jobs.running());
    EXPECT_EQ(jobs.get_job(running)->status, JobStatus::Failed);
    EXPECT_EQ(jobs.get_job(queued_a)->status, JobStatus::Cancelled);
    EXPECT_EQ(jobs.get_job(queued_b)->status, JobStatus::Cancelled);

    auto late = jobs.submit_job(analysis_job());
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).category, ErrorCategory::Overload);
    EXPECT_EQ(get_error(late).code, "job_orchestrator_stopped");
}

TEST_F(JobOrchestratorTest, TerminalJobsAreEvictedBeyondRetention) {
    JobSettings settings;
    settings.queue_capacity = 1;
    settings.max_retained_jobs = 2;
    JobOrchestrator jobs(settings);

    const auto kept = get_value(jobs.submit_job(analysis_job()));
    const auto evicted = get_value(jobs.submit_job(analysis_job()));
    const auto newest = get_value(jobs.submit_job(analysis_job()));

    EXPECT_TRUE(jobs.get_job(kept).has_value());
    EXPECT_FALSE(jobs.get_job(evicted).has_value());
    EXPECT_TRUE(jobs.get_job(newest).has_value());
    EXPECT_EQ(jobs.get_stats().total, 2u);
}

TEST_F(JobOrchestratorTest, ListFiltersByStatusInSubmissionOrder) {
    JobSettings settings;
    settings.queue_capacity = 2;
    JobOrchestrator jobs(settings);
    const auto a = get_value(jobs.submit_job(analysis_job("job-a")));
    const auto b = get_value(jobs.submit_job(analysis_job("job-b")));
    const auto c = get_value(jobs.submit_job(analysis_job("job-c")));
    ASSERT_FALSE(is_error(jobs.cancel_job(b)));

    const auto all = jobs.list_jobs();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, a);
    EXPECT_EQ(all[2].id, c);

    const auto cancelled = jobs.list_jobs(JobStatus::Cancelled);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].id, "job-b");
    EXPECT_EQ(jobs.list_jobs(JobStatus::Failed).size(), 1u);

    auto duplicate = jobs.submit_job(analysis_job("job-a"));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_job_id");
}

TEST_F(JobOrchestratorTest, HandlersCannotChangeAfterStart) {
    JobOrchestrator jobs;
    jobs.start();
    EXPECT_TRUE(is_error(jobs.set_handlers(JobHandlers{})));
    jobs.stop();
}

TEST_F(JobOrchestratorTest, PublishesLifecycleEvents) {
    conduit::events::EventBus bus;
    JobOrchestrator jobs({}, &bus);
    jobs.start();

    const auto id = get_value(jobs.submit_job(analysis_job()));
    ASSERT_TRUE(wait_for_status(jobs, id, JobStatus::Completed));
    jobs.stop();

    std::vector<EventType> types;
    for (const auto& event : bus.get_event_history()) {
        if (event.data.value("job_id", "") == id) {
            types.push_back(event.type);
        }
    }
    EXPECT_EQ(types, (std::vector<EventType>{EventType::JobSubmitted, EventType::JobStarted,
                                             EventType::JobCompleted}));
    bus.close();
}

}  // namespace
