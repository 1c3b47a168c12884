//
// Created by Sanger Steel on 6/15/25.
//

#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "yaml-cpp/yaml.h"
#include "prompts.hpp"
#include "request_parameters.hpp"
#include "result_types.hpp"

// Invalid or unreadable configuration. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct TransportConfig {
    std::string url;
    std::string api_key;
    std::string api_key_env = "RAMP_API_KEY";
    std::string model = "meta-llama/Llama-3.3-70B-Instruct";
    EndpointFormat format = EndpointFormat::AUTO;
    double timeout_s = 60;
    int max_tokens = 64;
    float temperature = 0.7;

    // Literal key if set, otherwise the environment variable, otherwise ""
    std::string resolve_api_key() const;

    RequestParameters request_defaults() const;
};

struct PromptConfig {
    std::string base_prompt =
        "Explain, step by step, how a request travels from a client through a load balancer "
        "to an inference server and back, naming each component it passes through.";
    std::string warmup_prompt = "This is a warm-up request to initialize the GPU.";
    int target_tokens = 500;
    size_t pool_size = 1000;
    PoolExhaustion exhaustion = PoolExhaustion::CYCLE;
};

struct SweepConfig {
    TransportConfig transport;
    PromptConfig prompts;

    std::vector<int> concurrency_levels = {2, 4, 8, 16, 32};
    int repetitions = 3;
    int warmup_requests = 5;
    // 0 means one request per worker, i.e. the concurrency level
    int requests_per_run = 0;
    // 0 disables the bound
    double run_duration_s = 0;
    // 0 disables the deadline
    double run_deadline_s = 0;
    double break_between_levels_s = 5;
    int max_retries = 0;
    FailedTokenPolicy failed_token_policy = FailedTokenPolicy::EXCLUDE;

    std::string output_dir = "load_test_results";
    bool write_outcomes = true;

    // Throws ConfigError on the first invalid field
    void validate() const;

    std::string to_str() const;
};

SweepConfig config_from_yaml(const YAML::Node& node);

SweepConfig load_config(const std::string& yaml_filename);

std::vector<int> parse_concurrency_levels(const std::string& csv);
