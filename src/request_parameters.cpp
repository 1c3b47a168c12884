//
// Created by Sanger Steel on 6/14/25.
//

#include "request_parameters.hpp"
#include <stdexcept>

const char* endpoint_format_as_str(EndpointFormat format) {
    switch (format) {
        case EndpointFormat::AUTO: return "auto";
        case EndpointFormat::CHAT: return "chat";
        case EndpointFormat::COMPLETIONS: return "completions";
        case EndpointFormat::SCORE: return "score";
        default: return "invalid";
    }
}

EndpointFormat endpoint_format_from_str(const std::string& str) {
    if (str == "auto") return EndpointFormat::AUTO;
    if (str == "chat") return EndpointFormat::CHAT;
    if (str == "completions") return EndpointFormat::COMPLETIONS;
    if (str == "score") return EndpointFormat::SCORE;
    throw std::invalid_argument(std::format("Unknown endpoint format: {}", str));
}

EndpointFormat resolve_endpoint_format(EndpointFormat format, const std::string& url) {
    if (format != EndpointFormat::AUTO) {
        return format;
    }
    if (url.find("/score") != std::string::npos) {
        return EndpointFormat::SCORE;
    }
    const std::string completions = "/completions";
    const std::string chat_completions = "/chat/completions";
    auto ends_with = [&url](const std::string& suffix) {
        return url.size() >= suffix.size() && url.compare(url.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(completions) && !ends_with(chat_completions)) {
        return EndpointFormat::COMPLETIONS;
    }
    return EndpointFormat::CHAT;
}
