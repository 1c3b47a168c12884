//
// Created by Sanger Steel on 6/16/25.
//

#include "request_executor.hpp"
#include <format>
#include <stdexcept>
#include "completion_types.hpp"
#include "logger.hpp"

constexpr size_t max_error_body_chars = 256;

namespace {

void mark_failed(RequestOutcome& outcome, ErrorKind kind, std::string message) {
    outcome.success = false;
    outcome.error = kind;
    outcome.error_message = std::move(message);
}

std::string truncate_body(const std::string& body) {
    if (body.size() <= max_error_body_chars) {
        return body;
    }
    return body.substr(0, max_error_body_chars) + "...";
}

}

RequestExecutor::RequestExecutor(SharedClient shared_client, RequestParameters defaults)
    : shared_client(std::move(shared_client)), defaults(std::move(defaults)) {
    if (!this->shared_client) {
        throw std::invalid_argument("RequestExecutor needs a transport");
    }
}

void classify_response(
    RequestOutcome& outcome,
    const TransportResponse& response,
    const PromptRecord& prompt,
    EndpointFormat format
) {
    outcome.http_status = response.http_status;
    outcome.ttfb = response.latencies.ttfb;
    switch (response.status) {
        case TransportStatus::TIMED_OUT:
        case TransportStatus::CANCELLED:
            mark_failed(outcome, ErrorKind::TIMEOUT, response.error_message);
            return;
        case TransportStatus::FAILED:
            mark_failed(outcome, ErrorKind::TRANSPORT_ERROR, response.error_message);
            return;
        default:
            break;
    }

    if (!response.http_success()) {
        mark_failed(outcome, ErrorKind::ENDPOINT_ERROR,
                    std::format("HTTP {}: {}", response.http_status, truncate_body(response.body)));
        return;
    }

    CompletionResponse parsed;
    try {
        parsed = CompletionResponse(response.body, format);
    } catch (const json::exception& e) {
        mark_failed(outcome, ErrorKind::PARSE_ERROR, e.what());
        return;
    } catch (const std::runtime_error& e) {
        mark_failed(outcome, ErrorKind::PARSE_ERROR, e.what());
        return;
    }

    if (parsed.reports_usage()) {
        outcome.output_tokens = parsed.usage.completion_tokens.value();
        if (parsed.usage.prompt_tokens.has_value()) {
            outcome.input_tokens = parsed.usage.prompt_tokens.value();
        } else {
            outcome.input_tokens = estimate_tokens(prompt.text);
            outcome.tokens_estimated = true;
        }
    } else {
        outcome.output_tokens = estimate_tokens(parsed.text);
        outcome.input_tokens = estimate_tokens(prompt.text);
        outcome.tokens_estimated = true;
    }
    outcome.success = true;
    outcome.error = std::nullopt;
}

RequestOutcome RequestExecutor::execute(const PromptRecord& prompt, const CancellationToken& token) const {
    RequestOutcome outcome;
    outcome.id = prompt.id;

    RequestParameters req = defaults;
    req.prompt = prompt.text;

    TransportResponse response;
    outcome.start = steady::now();
    try {
        response = shared_client->send(req, token);
    } catch (const std::exception& e) {
        response.status = TransportStatus::FAILED;
        response.error_message = e.what();
    }
    outcome.end = steady::now();
    outcome.completed_at = std::chrono::system_clock::now();
    outcome.elapsed = seconds_between(outcome.start, outcome.end);

    classify_response(outcome, response, prompt, req.format);

    if (!outcome.success) {
        Logger.requests_failed.fetch_add(1, std::memory_order_acq_rel);
        Logger.debug(std::format("Request {} failed after {:.3f}s: {} ({})",
                                 outcome.id, outcome.elapsed,
                                 error_kind_as_str(outcome.error.value()), outcome.error_message));
    }
    if (response.status == TransportStatus::CANCELLED) {
        Logger.requests_cancelled.fetch_add(1, std::memory_order_acq_rel);
    }
    return outcome;
}
