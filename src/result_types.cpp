//
// Created by Sanger Steel on 5/20/25.
//

#include "result_types.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>

const char* error_kind_as_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::TRANSPORT_ERROR: return "transport_error";
        case ErrorKind::ENDPOINT_ERROR: return "endpoint_error";
        case ErrorKind::PARSE_ERROR: return "parse_error";
        default: return "invalid";
    }
}

const char* failed_token_policy_as_str(FailedTokenPolicy policy) {
    switch (policy) {
        case FailedTokenPolicy::EXCLUDE: return "exclude";
        case FailedTokenPolicy::ZERO: return "zero";
        default: return "invalid";
    }
}

FailedTokenPolicy failed_token_policy_from_str(const std::string& str) {
    if (str == "exclude") return FailedTokenPolicy::EXCLUDE;
    if (str == "zero") return FailedTokenPolicy::ZERO;
    throw std::invalid_argument(std::format("Unknown failed token policy: {}", str));
}

json RequestOutcome::to_json(const time_point& run_start) const {
    json j;
    j["id"] = id;
    j["success"] = success;
    j["error"] = error.has_value() ? json(error_kind_as_str(error.value())) : json(nullptr);
    if (!error_message.empty()) {
        j["error_message"] = error_message;
    }
    j["http_status"] = http_status;
    j["start_s"] = seconds_between(run_start, start);
    j["end_s"] = seconds_between(run_start, end);
    j["response_time"] = elapsed;
    j["ttfb"] = ttfb;
    j["tokens_input"] = input_tokens;
    j["tokens_generated"] = output_tokens;
    j["total_tokens"] = input_tokens + output_tokens;
    j["tokens_estimated"] = tokens_estimated;
    j["tokens_per_second"] = elapsed > 0 ? output_tokens / elapsed : 0.0;
    j["total_tokens_per_second"] = elapsed > 0 ? (input_tokens + output_tokens) / elapsed : 0.0;
    j["attempts"] = attempts;
    j["timestamp"] = seconds_since_epoch(completed_at);
    return j;
}

RunMetrics RunMetrics::from_run(const LevelRun& run, FailedTokenPolicy policy) {
    RunMetrics metrics;
    metrics.total = static_cast<int>(run.outcomes.size());

    std::optional<time_point> window_start;
    std::optional<time_point> window_end;
    double response_time_sum = 0;
    int timed_successes = 0;

    for (const auto& outcome: run.outcomes) {
        if (outcome.success) {
            metrics.successes++;
            metrics.input_tokens += outcome.input_tokens;
            metrics.output_tokens += outcome.output_tokens;
            if (outcome.elapsed > 0) {
                response_time_sum += outcome.elapsed;
                timed_successes++;
            }
        } else {
            metrics.failures++;
        }
        if (outcome.success || policy == FailedTokenPolicy::ZERO) {
            if (!window_start.has_value() || outcome.start < window_start.value()) {
                window_start = outcome.start;
            }
            if (!window_end.has_value() || outcome.end > window_end.value()) {
                window_end = outcome.end;
            }
        }
    }

    if (window_start.has_value() && window_end.has_value()) {
        metrics.window_duration = std::max(0.0, seconds_between(window_start.value(), window_end.value()));
    }
    if (timed_successes > 0) {
        metrics.avg_response_time = response_time_sum / timed_successes;
    }
    if (metrics.total > 0) {
        metrics.success_rate = static_cast<double>(metrics.successes) / metrics.total;
    }
    if (metrics.window_duration > 0) {
        metrics.requests_per_second = metrics.successes / metrics.window_duration;
        metrics.output_token_throughput = metrics.output_tokens / metrics.window_duration;
        metrics.combined_token_throughput = (metrics.input_tokens + metrics.output_tokens) / metrics.window_duration;
    }
    return metrics;
}

MetricSummary MetricSummary::from_values(const std::vector<double>& values) {
    MetricSummary summary;
    if (values.empty()) {
        return summary;
    }
    auto n = static_cast<double>(values.size());
    summary.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    if (values.size() < 2) {
        return summary;
    }
    double squares = 0;
    for (auto value: values) {
        squares += (value - summary.mean) * (value - summary.mean);
    }
    summary.stdev = std::sqrt(squares / (n - 1));
    return summary;
}

LevelSummary LevelSummary::from_runs(int concurrency, const std::vector<LevelRun>& runs, FailedTokenPolicy policy) {
    LevelSummary summary;
    summary.concurrency = concurrency;
    summary.repetitions = static_cast<int>(runs.size());

    std::vector<double> response_times;
    std::vector<double> throughputs;
    std::vector<double> output_token_throughputs;
    std::vector<double> combined_token_throughputs;
    std::vector<double> success_rates;
    long dispatched = 0;

    for (const auto& run: runs) {
        auto metrics = RunMetrics::from_run(run, policy);
        dispatched += run.dispatched;
        if (run.deadline_truncated) {
            summary.truncated_runs++;
        }
        if (run.prompts_exhausted) {
            summary.exhausted_runs++;
        }
        // A repetition without successes has no response time to average
        if (metrics.avg_response_time > 0) {
            response_times.emplace_back(metrics.avg_response_time);
        }
        throughputs.emplace_back(metrics.requests_per_second);
        output_token_throughputs.emplace_back(metrics.output_token_throughput);
        combined_token_throughputs.emplace_back(metrics.combined_token_throughput);
        success_rates.emplace_back(metrics.success_rate);
    }

    if (!runs.empty()) {
        summary.requests = static_cast<int>(std::lround(static_cast<double>(dispatched) / runs.size()));
    }
    summary.response_time = MetricSummary::from_values(response_times);
    summary.throughput = MetricSummary::from_values(throughputs);
    summary.output_token_throughput = MetricSummary::from_values(output_token_throughputs);
    summary.combined_token_throughput = MetricSummary::from_values(combined_token_throughputs);
    summary.success_rate = MetricSummary::from_values(success_rates);
    return summary;
}
