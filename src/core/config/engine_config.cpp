#include "core/config/engine_config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

namespace conduit::core::config {

using errors::EngineError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::uint64_t kMaxCount = 1000000;
constexpr std::uint64_t kMaxMillis = 7ULL * 24 * 60 * 60 * 1000;

EngineError invalid_key(const std::string& key, const std::string& expectation) {
    return EngineError{ErrorCategory::Validation,
                       "Configuration key '" + key + "' " + expectation + ".",
                       "invalid_config_value"};
}

// Reads a positive integer from section[key] when present.
errors::Status read_count(const json& section, const std::string& section_name,
                          const std::string& key, std::size_t& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return errors::ok();
    }
    const std::string path = section_name + "." + key;
    if (!it->is_number_integer()) {
        return invalid_key(path, "must be an integer");
    }
    const std::int64_t value = it->get<std::int64_t>();
    if (value <= 0 || static_cast<std::uint64_t>(value) > kMaxCount) {
        return invalid_key(path, "must be between 1 and " + std::to_string(kMaxCount));
    }
    out = static_cast<std::size_t>(value);
    return errors::ok();
}

// Same as read_count but 0 is accepted (e.g. no retries).
errors::Status read_count_or_zero(const json& section, const std::string& section_name,
                                  const std::string& key, std::size_t& out) {
    const auto it = section.find(key);
    if (it != section.end() && it->is_number_integer() && it->get<std::int64_t>() == 0) {
        out = 0;
        return errors::ok();
    }
    return read_count(section, section_name, key, out);
}

errors::Status read_millis(const json& section, const std::string& section_name,
                           const std::string& key, std::chrono::milliseconds& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return errors::ok();
    }
    const std::string path = section_name + "." + key;
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0 ||
        static_cast<std::uint64_t>(it->get<std::int64_t>()) > kMaxMillis) {
        return invalid_key(path, "must be a positive number of milliseconds up to 7 days");
    }
    out = std::chrono::milliseconds(it->get<std::int64_t>());
    return errors::ok();
}

const json& section_or_empty(const json& document, const std::string& name) {
    static const json empty = json::object();
    const auto it = document.find(name);
    if (it == document.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

errors::Result<logging::LogLevel> parse_log_level(const std::string& text) {
    const auto level = logging::parse_level(text);
    if (!level.has_value()) {
        return invalid_key("log_level", "must be one of debug, info, warn, error");
    }
    return level.value();
}

errors::Result<std::uint64_t> parse_env_number(const char* name, const std::string& raw,
                                               bool allow_zero, std::uint64_t max) {
    std::uint64_t value = 0;
    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return invalid_key(name, "must be an integer");
    }
    if ((!allow_zero && value == 0) || value > max) {
        return invalid_key(name, "is out of range");
    }
    return value;
}

}  // namespace

errors::Result<EngineConfig> parse_engine_config(const json& document, EngineConfig base) {
    if (!document.is_object()) {
        return EngineError{ErrorCategory::Validation,
                           "Configuration document must be a JSON object.",
                           "invalid_config_document"};
    }

    EngineConfig config = std::move(base);
    const auto level = document.find("log_level");
    if (level != document.end()) {
        if (!level->is_string()) {
            return invalid_key("log_level", "must be a string");
        }
        auto parsed = parse_log_level(level->get<std::string>());
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.log_level = errors::get_value(parsed);
    }

    const json& orchestrator = section_or_empty(document, "orchestrator");
    const json& jobs = section_or_empty(document, "jobs");
    const json& events = section_or_empty(document, "events");
    const json& resilience = section_or_empty(document, "resilience");

    const errors::Status checks[] = {
        read_millis(orchestrator, "orchestrator", "default_timeout_ms",
                    config.orchestrator.default_timeout),
        read_count(jobs, "jobs", "worker_count", config.jobs.worker_count),
        read_count(jobs, "jobs", "queue_capacity", config.jobs.queue_capacity),
        read_millis(jobs, "jobs", "job_timeout_ms", config.jobs.job_timeout),
        read_count(jobs, "jobs", "max_retained_jobs", config.jobs.max_retained_jobs),
        read_count(events, "events", "worker_count", config.events.worker_count),
        read_count(events, "events", "buffer_size", config.events.buffer_size),
        read_count(events, "events", "max_history", config.events.max_history),
        read_millis(events, "events", "handler_timeout_ms", config.events.handler_timeout),
        read_count(resilience, "resilience", "breaker_max_failures",
                   config.resilience.breaker_max_failures),
        read_millis(resilience, "resilience", "breaker_reset_timeout_ms",
                    config.resilience.breaker_reset_timeout),
        read_count(resilience, "resilience", "max_breakers", config.resilience.max_breakers),
        read_count_or_zero(resilience, "resilience", "max_retries",
                           config.resilience.max_retries),
        read_millis(resilience, "resilience", "base_delay_ms", config.resilience.base_delay),
        read_millis(resilience, "resilience", "max_delay_ms", config.resilience.max_delay),
        read_count(resilience, "resilience", "latency_window",
                   config.resilience.latency_window),
        read_count(resilience, "resilience", "max_correlations",
                   config.resilience.max_correlations),
    };
    for (const auto& check : checks) {
        if (errors::is_error(check)) {
            return errors::get_error(check);
        }
    }

    const auto source = events.find("source");
    if (source != events.end()) {
        if (!source->is_string() || source->get<std::string>().empty()) {
            return invalid_key("events.source", "must be a non-empty string");
        }
        config.events.source = source->get<std::string>();
    }

    if (config.resilience.base_delay > config.resilience.max_delay) {
        return invalid_key("resilience.base_delay_ms", "cannot exceed resilience.max_delay_ms");
    }
    return config;
}

errors::Result<EngineConfig> load_engine_config_file(const std::filesystem::path& path,
                                                     EngineConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return EngineError{ErrorCategory::NotFound,
                           "Configuration file not found: " + path.string(),
                           "config_file_not_found"};
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return EngineError{ErrorCategory::Validation,
                           "Configuration file is not valid JSON: " + path.string(),
                           "invalid_config_document"};
    }
    return parse_engine_config(document, std::move(base));
}

errors::Result<EngineConfig> apply_environment_overrides(EngineConfig config) {
    if (const char* raw = std::getenv("CONDUIT_LOG_LEVEL"); raw != nullptr) {
        auto parsed = parse_log_level(raw);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.log_level = errors::get_value(parsed);
    }

    struct CountOverride {
        const char* name;
        std::size_t* target;
        bool allow_zero;
    };
    const CountOverride counts[] = {
        {"CONDUIT_JOB_WORKERS", &config.jobs.worker_count, false},
        {"CONDUIT_JOB_QUEUE_CAPACITY", &config.jobs.queue_capacity, false},
        {"CONDUIT_EVENT_WORKERS", &config.events.worker_count, false},
        {"CONDUIT_EVENT_BUFFER_SIZE", &config.events.buffer_size, false},
        {"CONDUIT_EVENT_HISTORY", &config.events.max_history, false},
        {"CONDUIT_BREAKER_MAX_FAILURES", &config.resilience.breaker_max_failures, false},
        {"CONDUIT_MAX_RETRIES", &config.resilience.max_retries, true},
    };
    for (const auto& entry : counts) {
        const char* raw = std::getenv(entry.name);
        if (raw == nullptr) {
            continue;
        }
        auto parsed = parse_env_number(entry.name, raw, entry.allow_zero, kMaxCount);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        *entry.target = static_cast<std::size_t>(errors::get_value(parsed));
    }

    struct DurationOverride {
        const char* name;
        std::chrono::milliseconds* target;
    };
    const DurationOverride durations[] = {
        {"CONDUIT_DEFAULT_TIMEOUT_MS", &config.orchestrator.default_timeout},
        {"CONDUIT_JOB_TIMEOUT_MS", &config.jobs.job_timeout},
        {"CONDUIT_BREAKER_RESET_TIMEOUT_MS", &config.resilience.breaker_reset_timeout},
        {"CONDUIT_RETRY_BASE_DELAY_MS", &config.resilience.base_delay},
    };
    for (const auto& entry : durations) {
        const char* raw = std::getenv(entry.name);
        if (raw == nullptr) {
            continue;
        }
        auto parsed = parse_env_number(entry.name, raw, false, kMaxMillis);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        *entry.target = std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(errors::get_value(parsed)));
    }

    if (config.resilience.base_delay > config.resilience.max_delay) {
        return invalid_key("CONDUIT_RETRY_BASE_DELAY_MS", "cannot exceed the maximum retry delay");
    }
    return config;
}

}  // namespace conduit::core::config
