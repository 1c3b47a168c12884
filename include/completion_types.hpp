//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "request_parameters.hpp"

using json = nlohmann::json;

struct TokenUsage {
    std::optional<int> prompt_tokens;
    std::optional<int> completion_tokens;

    TokenUsage() = default;

    explicit TokenUsage(const json& usage_json);
};

// The parts of a completion response ramp measures. Construction throws
// json::exception (parse_error, type_error, out_of_range) or
// std::runtime_error when the body doesn't look like a completion.
struct CompletionResponse {
    CompletionResponse() = default;

    CompletionResponse(const std::string& json_str, EndpointFormat format);

    std::string id;
    std::string model;
    std::string text;
    std::string finish_reason;
    TokenUsage usage;

    bool reports_usage() const {
        return usage.completion_tokens.has_value() && usage.completion_tokens.value() > 0;
    }
};

// Whitespace-separated word count. Stands in for a tokenizer when the
// endpoint does not report usage.
int estimate_tokens(const std::string& text);
