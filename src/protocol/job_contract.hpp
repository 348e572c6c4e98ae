#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"

namespace conduit::protocol {

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

enum class JobType {
    Analysis,
    Build,
    Deploy,
    Unknown
};

// Asynchronously tracked unit of longer-running work. parameters and result
// are the loosely typed bags exchanged with callers; workers only see the
// typed JobPayload parsed from parameters at submission.
struct Job {
    std::string id;
    std::string type;
    JobStatus status = JobStatus::Pending;
    nlohmann::json parameters = nlohmann::json::object();
    nlohmann::json result;
    std::string error;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

struct AnalysisJob {
    std::string repo_path;
    std::string language_hint;
    bool deep_scan = false;
};

struct BuildJob {
    std::string image_name;
    std::string dockerfile_path = "Dockerfile";
    std::string context_path = ".";
    std::vector<std::string> tags;
};

struct DeployJob {
    std::string manifest_path;
    std::string target_namespace = "default";
};

struct UnknownJob {
    std::string type;
};

using JobPayload = std::variant<AnalysisJob, BuildJob, DeployJob, UnknownJob>;

struct OrchestratorStats {
    std::size_t total = 0;
    std::size_t pending = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
};

JobType job_type_from_string(const std::string& text);

// Resolves the job kind once and validates its parameters.
core::errors::Result<JobPayload> parse_job_payload(const std::string& type,
                                                   const nlohmann::json& parameters);

inline bool is_terminal(const JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

inline std::string to_string(const JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline std::string to_string(const JobType type) {
    switch (type) {
        case JobType::Analysis:
            return "analysis";
        case JobType::Build:
            return "build";
        case JobType::Deploy:
            return "deploy";
        default:
            return "unknown";
    }
}

}  // namespace conduit::protocol
