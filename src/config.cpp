//
// Created by Sanger Steel on 6/15/25.
//

#include "config.hpp"
#include <cstdlib>
#include <format>
#include <sstream>

namespace {

template<typename T>
void maybe_set(const YAML::Node& node, const char* key, T& to_set) {
    if (node && node[key]) {
        to_set = node[key].as<T>();
    }
}

std::string join(const std::vector<int>& values, const std::string& delim = ", ") {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += delim;
        }
        joined += std::to_string(values[i]);
    }
    return joined;
}

}

std::string TransportConfig::resolve_api_key() const {
    if (!api_key.empty()) {
        return api_key;
    }
    if (!api_key_env.empty()) {
        if (const char* from_env = std::getenv(api_key_env.c_str())) {
            return from_env;
        }
    }
    return "";
}

RequestParameters TransportConfig::request_defaults() const {
    RequestParameters req;
    req.model = model;
    req.temperature = temperature;
    req.max_tokens = max_tokens;
    req.format = resolve_endpoint_format(format, url);
    return req;
}

void SweepConfig::validate() const {
    if (transport.url.empty()) {
        throw ConfigError("endpoint.url is required");
    }
    if (transport.timeout_s <= 0) {
        throw ConfigError(std::format("endpoint.timeout_s must be positive, got {}", transport.timeout_s));
    }
    if (transport.max_tokens <= 0) {
        throw ConfigError(std::format("endpoint.max_tokens must be positive, got {}", transport.max_tokens));
    }
    if (concurrency_levels.empty()) {
        throw ConfigError("sweep.concurrency_levels must name at least one level");
    }
    for (auto level: concurrency_levels) {
        if (level <= 0) {
            throw ConfigError(std::format("Concurrency levels must be positive, got {}", level));
        }
    }
    if (repetitions < 1) {
        throw ConfigError(std::format("sweep.repetitions must be at least 1, got {}", repetitions));
    }
    if (warmup_requests < 0) {
        throw ConfigError(std::format("sweep.warmup_requests can't be negative, got {}", warmup_requests));
    }
    if (requests_per_run < 0) {
        throw ConfigError(std::format("sweep.requests_per_run can't be negative, got {}", requests_per_run));
    }
    if (run_duration_s < 0 || run_deadline_s < 0 || break_between_levels_s < 0) {
        throw ConfigError("sweep durations can't be negative");
    }
    if (max_retries < 0) {
        throw ConfigError(std::format("sweep.max_retries can't be negative, got {}", max_retries));
    }
    if (prompts.pool_size < 1) {
        throw ConfigError("prompts.pool_size must be at least 1");
    }
    if (output_dir.empty()) {
        throw ConfigError("output.directory can't be empty");
    }
}

std::string SweepConfig::to_str() const {
    std::string str = "==========\nSWEEP CONFIG\n";
    str += std::format("endpoint: {} ({})\n", transport.url,
                       endpoint_format_as_str(resolve_endpoint_format(transport.format, transport.url)));
    str += std::format("model: {}\n", transport.model);
    str += std::format("timeout: {}s\n", transport.timeout_s);
    str += std::format("concurrency_levels: [{}]\n", join(concurrency_levels));
    str += std::format("repetitions: {}\n", repetitions);
    str += std::format("warmup_requests: {}\n", warmup_requests);
    str += std::format("requests_per_run: {}\n", requests_per_run);
    str += std::format("run_duration: {}s\n", run_duration_s);
    str += std::format("run_deadline: {}s\n", run_deadline_s);
    str += std::format("max_retries: {}\n", max_retries);
    str += std::format("failed_token_policy: {}\n", failed_token_policy_as_str(failed_token_policy));
    str += std::format("prompt_pool: {} ({})\n", prompts.pool_size, pool_exhaustion_as_str(prompts.exhaustion));
    str += std::format("output_dir: {}\n", output_dir);
    str += "==========\n";
    return str;
}

SweepConfig config_from_yaml(const YAML::Node& node) {
    SweepConfig cfg;
    try {
        const auto endpoint = node["endpoint"];
        maybe_set(endpoint, "url", cfg.transport.url);
        maybe_set(endpoint, "api_key", cfg.transport.api_key);
        maybe_set(endpoint, "api_key_env", cfg.transport.api_key_env);
        maybe_set(endpoint, "model", cfg.transport.model);
        maybe_set(endpoint, "timeout_s", cfg.transport.timeout_s);
        maybe_set(endpoint, "max_tokens", cfg.transport.max_tokens);
        maybe_set(endpoint, "temperature", cfg.transport.temperature);
        if (endpoint && endpoint["format"]) {
            cfg.transport.format = endpoint_format_from_str(endpoint["format"].as<std::string>());
        }

        const auto sweep = node["sweep"];
        maybe_set(sweep, "concurrency_levels", cfg.concurrency_levels);
        maybe_set(sweep, "repetitions", cfg.repetitions);
        maybe_set(sweep, "warmup_requests", cfg.warmup_requests);
        maybe_set(sweep, "requests_per_run", cfg.requests_per_run);
        maybe_set(sweep, "run_duration_s", cfg.run_duration_s);
        maybe_set(sweep, "run_deadline_s", cfg.run_deadline_s);
        maybe_set(sweep, "break_between_levels_s", cfg.break_between_levels_s);
        maybe_set(sweep, "max_retries", cfg.max_retries);
        if (sweep && sweep["failed_token_policy"]) {
            cfg.failed_token_policy = failed_token_policy_from_str(sweep["failed_token_policy"].as<std::string>());
        }

        const auto prompts = node["prompts"];
        maybe_set(prompts, "base_prompt", cfg.prompts.base_prompt);
        maybe_set(prompts, "warmup_prompt", cfg.prompts.warmup_prompt);
        maybe_set(prompts, "target_tokens", cfg.prompts.target_tokens);
        if (prompts && prompts["pool_size"]) {
            auto pool_size = prompts["pool_size"].as<long>();
            if (pool_size < 1) {
                throw ConfigError("prompts.pool_size must be at least 1");
            }
            cfg.prompts.pool_size = static_cast<size_t>(pool_size);
        }
        if (prompts && prompts["exhaustion"]) {
            cfg.prompts.exhaustion = pool_exhaustion_from_str(prompts["exhaustion"].as<std::string>());
        }

        const auto output = node["output"];
        maybe_set(output, "directory", cfg.output_dir);
        maybe_set(output, "write_outcomes", cfg.write_outcomes);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::format("Malformed config: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return cfg;
}

SweepConfig load_config(const std::string& yaml_filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::format("Could not load config {}: {}", yaml_filename, e.what()));
    }
    return config_from_yaml(root);
}

std::vector<int> parse_concurrency_levels(const std::string& csv) {
    std::vector<int> levels;
    std::stringstream stream(csv);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) {
            continue;
        }
        try {
            size_t consumed = 0;
            levels.emplace_back(std::stoi(item, &consumed));
            if (consumed != item.size()) {
                throw std::invalid_argument(item);
            }
        } catch (const std::logic_error&) {
            throw ConfigError(std::format("Invalid concurrency level: '{}'", item));
        }
    }
    return levels;
}
