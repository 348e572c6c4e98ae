#include "protocol/job_contract.hpp"

namespace conduit::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

EngineError invalid_parameter(const std::string& type, const std::string& key,
                              const std::string& expectation) {
    return EngineError{ErrorCategory::Validation,
                       "Job type " + type + ": parameter '" + key + "' " + expectation + ".",
                       "invalid_job_parameters"};
}

// Reads a required non-empty string parameter.
core::errors::Result<std::string> required_string(const std::string& type,
                                                  const json& parameters,
                                                  const std::string& key) {
    const auto it = parameters.find(key);
    if (it == parameters.end()) {
        return invalid_parameter(type, key, "is required");
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        return invalid_parameter(type, key, "must be a non-empty string");
    }
    return it->get<std::string>();
}

// Reads an optional string parameter, keeping the fallback when absent.
core::errors::Status optional_string(const std::string& type, const json& parameters,
                                     const std::string& key, std::string& out) {
    const auto it = parameters.find(key);
    if (it == parameters.end() || it->is_null()) {
        return core::errors::ok();
    }
    if (!it->is_string()) {
        return invalid_parameter(type, key, "must be a string");
    }
    out = it->get<std::string>();
    return core::errors::ok();
}

core::errors::Result<JobPayload> parse_analysis(const json& parameters) {
    auto repo_path = required_string("analysis", parameters, "repo_path");
    if (core::errors::is_error(repo_path)) {
        return core::errors::get_error(repo_path);
    }

    AnalysisJob job;
    job.repo_path = core::errors::get_value(repo_path);
    auto hint = optional_string("analysis", parameters, "language_hint", job.language_hint);
    if (core::errors::is_error(hint)) {
        return core::errors::get_error(hint);
    }
    const auto deep = parameters.find("deep_scan");
    if (deep != parameters.end()) {
        if (!deep->is_boolean()) {
            return invalid_parameter("analysis", "deep_scan", "must be a boolean");
        }
        job.deep_scan = deep->get<bool>();
    }
    return JobPayload{job};
}

core::errors::Result<JobPayload> parse_build(const json& parameters) {
    auto image_name = required_string("build", parameters, "image_name");
    if (core::errors::is_error(image_name)) {
        return core::errors::get_error(image_name);
    }

    BuildJob job;
    job.image_name = core::errors::get_value(image_name);
    auto dockerfile = optional_string("build", parameters, "dockerfile_path", job.dockerfile_path);
    if (core::errors::is_error(dockerfile)) {
        return core::errors::get_error(dockerfile);
    }
    auto context = optional_string("build", parameters, "context_path", job.context_path);
    if (core::errors::is_error(context)) {
        return core::errors::get_error(context);
    }

    const auto tags = parameters.find("tags");
    if (tags != parameters.end()) {
        if (!tags->is_array()) {
            return invalid_parameter("build", "tags", "must be an array of strings");
        }
        for (const auto& tag : *tags) {
            if (!tag.is_string()) {
                return invalid_parameter("build", "tags", "must be an array of strings");
            }
            job.tags.push_back(tag.get<std::string>());
        }
    }
    return JobPayload{job};
}

core::errors::Result<JobPayload> parse_deploy(const json& parameters) {
    auto manifest = required_string("deploy", parameters, "manifest_path");
    if (core::errors::is_error(manifest)) {
        return core::errors::get_error(manifest);
    }

    DeployJob job;
    job.manifest_path = core::errors::get_value(manifest);
    auto ns = optional_string("deploy", parameters, "namespace", job.target_namespace);
    if (core::errors::is_error(ns)) {
        return core::errors::get_error(ns);
    }
    return JobPayload{job};
}

}  // namespace

JobType job_type_from_string(const std::string& text) {
    if (text == "analysis") {
        return JobType::Analysis;
    }
    if (text == "build") {
        return JobType::Build;
    }
    if (text == "deploy") {
        return JobType::Deploy;
    }
    return JobType::Unknown;
}

core::errors::Result<JobPayload> parse_job_payload(const std::string& type,
                                                   const json& parameters) {
    if (!parameters.is_object()) {
        return EngineError{ErrorCategory::Validation,
                           "Job parameters must be a JSON object.",
                           "invalid_job_parameters"};
    }

    switch (job_type_from_string(type)) {
        case JobType::Analysis:
            return parse_analysis(parameters);
        case JobType::Build:
            return parse_build(parameters);
        case JobType::Deploy:
            return parse_deploy(parameters);
        case JobType::Unknown:
        default:
            return JobPayload{UnknownJob{type}};
    }
}

}  // namespace conduit::protocol
