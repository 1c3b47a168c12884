//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <string>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Body shapes understood by the endpoints ramp can drive.
enum class EndpointFormat {
    AUTO,
    CHAT,         // OpenAI-compatible /v1/chat/completions
    COMPLETIONS,  // legacy /v1/completions
    SCORE,        // Azure ML managed online endpoint /score
};

const char* endpoint_format_as_str(EndpointFormat format);

EndpointFormat endpoint_format_from_str(const std::string& str);

// Resolves AUTO from the shape of the URL; other formats pass through.
EndpointFormat resolve_endpoint_format(EndpointFormat format, const std::string& url);

struct RequestParameters {
    std::string model = "meta-llama/Llama-3.3-70B-Instruct";
    std::string prompt;
    float temperature = 0.7;
    int max_tokens = 64;
    EndpointFormat format = EndpointFormat::CHAT;

    json to_json() const;
    std::string to_str() const;
};

inline json RequestParameters::to_json() const {
    json j;
    switch (format) {
        case EndpointFormat::SCORE:
            j["input_data"]["input_string"] = json::array({
                {{"role", "user"}, {"content", prompt}}
            });
            j["input_data"]["parameters"]["temperature"] = temperature;
            j["input_data"]["parameters"]["max_tokens"] = max_tokens;
            return j;
        case EndpointFormat::COMPLETIONS:
            j["model"] = model;
            j["prompt"] = prompt;
            break;
        default:
            j["model"] = model;
            j["messages"] = json::array({
                {{"role", "user"}, {"content", prompt}}
            });
            break;
    }
    j["max_tokens"] = max_tokens;
    j["temperature"] = temperature;
    return j;
}

inline std::string RequestParameters::to_str() const {
    std::string str = "==========\nREQUEST PARAMETERS\n";
    str += std::format("format: {}\n", endpoint_format_as_str(format));
    str += std::format("model: {}\n", model);
    str += std::format("prompt: {}\n", prompt);
    str += std::format("temperature: {}\n", temperature);
    str += std::format("max_tokens: {}\n", max_tokens);
    str += "==========\n";
    return str;
}
