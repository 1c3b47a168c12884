//
// Created by Sanger Steel on 6/8/25.
//

#include "completion_types.hpp"
#include <cctype>
#include <stdexcept>

namespace {

std::optional<int> maybe_int(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<int>();
}

std::string maybe_string(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return "";
    }
    return j.at(key).get<std::string>();
}

const json& first_choice(const json& as_json) {
    const auto& choice_list = as_json.at("choices");
    if (!choice_list.is_array() || choice_list.empty()) {
        throw std::runtime_error("Response has no choices");
    }
    return choice_list.at(0);
}

}

TokenUsage::TokenUsage(const json& usage_json) {
    prompt_tokens = maybe_int(usage_json, "prompt_tokens");
    completion_tokens = maybe_int(usage_json, "completion_tokens");
}

CompletionResponse::CompletionResponse(const std::string& json_str, EndpointFormat format) {
    auto as_json = json::parse(json_str);
    if (!as_json.is_object()) {
        throw std::runtime_error("Response body is not a JSON object");
    }
    id = maybe_string(as_json, "id");
    model = as_json.value("model", "N/A");

    switch (format) {
        case EndpointFormat::SCORE: {
            if (!as_json.contains("output") && !as_json.contains("token_count")) {
                throw std::runtime_error("Response has neither output nor token_count");
            }
            text = maybe_string(as_json, "output");
            if (as_json.contains("token_count")) {
                usage = TokenUsage(as_json.at("token_count"));
            }
            break;
        }
        case EndpointFormat::COMPLETIONS: {
            const auto& choice = first_choice(as_json);
            text = maybe_string(choice, "text");
            finish_reason = maybe_string(choice, "finish_reason");
            if (as_json.contains("usage")) {
                usage = TokenUsage(as_json.at("usage"));
            }
            break;
        }
        default: {
            const auto& choice = first_choice(as_json);
            text = maybe_string(choice.at("message"), "content");
            finish_reason = maybe_string(choice, "finish_reason");
            if (as_json.contains("usage")) {
                usage = TokenUsage(as_json.at("usage"));
            }
            break;
        }
    }
}

int estimate_tokens(const std::string& text) {
    int words = 0;
    bool in_word = false;
    for (unsigned char c: text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            words++;
        }
    }
    return words;
}
