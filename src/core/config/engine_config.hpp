#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"

namespace conduit::core::config {

struct OrchestratorSettings {
    std::chrono::milliseconds default_timeout{std::chrono::minutes(10)};
};

struct JobSettings {
    std::size_t worker_count = 5;
    std::size_t queue_capacity = 100;
    std::chrono::milliseconds job_timeout{std::chrono::minutes(30)};
    std::size_t max_retained_jobs = 1000;
};

struct EventBusSettings {
    std::size_t worker_count = 3;
    std::size_t buffer_size = 1000;
    std::size_t max_history = 1000;
    std::chrono::milliseconds handler_timeout{std::chrono::seconds(30)};
    std::string source = "conduit";
};

struct ResilienceSettings {
    std::size_t breaker_max_failures = 5;
    std::chrono::milliseconds breaker_reset_timeout{std::chrono::seconds(60)};
    std::size_t max_breakers = 1000;
    std::size_t max_retries = 3;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{std::chrono::seconds(30)};
    std::size_t latency_window = 100;
    std::size_t max_correlations = 10000;
};

struct EngineConfig {
    OrchestratorSettings orchestrator;
    JobSettings jobs;
    EventBusSettings events;
    ResilienceSettings resilience;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Overlays the keys present in the document on the defaults. Layout:
// {"log_level": "...", "orchestrator": {...}, "jobs": {...},
//  "events": {...}, "resilience": {...}} with durations in *_ms keys.
errors::Result<EngineConfig> parse_engine_config(const nlohmann::json& document,
                                                 EngineConfig base = {});

errors::Result<EngineConfig> load_engine_config_file(const std::filesystem::path& path,
                                                     EngineConfig base = {});

// Applies CONDUIT_* environment variables on top of the given config.
errors::Result<EngineConfig> apply_environment_overrides(EngineConfig config);

}  // namespace conduit::core::config
