//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "latency_metrics.hpp"

using json = nlohmann::json;

enum class ErrorKind {
    TIMEOUT,
    TRANSPORT_ERROR,
    ENDPOINT_ERROR,
    PARSE_ERROR,
};

const char* error_kind_as_str(ErrorKind kind);

struct RequestOutcome {
    std::string id;
    time_point start;
    time_point end;
    double elapsed = 0;
    int input_tokens = 0;
    int output_tokens = 0;
    bool success = false;
    std::optional<ErrorKind> error = std::nullopt;
    std::string error_message;
    long http_status = 0;
    // Time to first byte as the transport measured it, 0 if unknown
    double ttfb = 0;
    int attempts = 1;
    bool tokens_estimated = false;
    wall_time_point completed_at;

    json to_json(const time_point& run_start) const;
};

// Outcomes of one concurrency level x one repetition. Sealed only once every
// dispatched request has reported, so outcomes.size() == dispatched.
struct LevelRun {
    int concurrency = 0;
    int repetition = 0;
    int dispatched = 0;
    bool deadline_truncated = false;
    // The prompt source ran dry before the request budget was spent
    bool prompts_exhausted = false;
    time_point started;
    double wall_duration = 0;
    std::vector<RequestOutcome> outcomes;

    bool complete() const {
        return outcomes.size() == static_cast<size_t>(dispatched);
    }
};

// Whether failed requests widen the throughput window (ZERO: counted as
// zero-token requests whose time still counts) or are left out of it.
enum class FailedTokenPolicy {
    EXCLUDE,
    ZERO,
};

const char* failed_token_policy_as_str(FailedTokenPolicy policy);

FailedTokenPolicy failed_token_policy_from_str(const std::string& str);

struct RunMetrics {
    int total = 0;
    int successes = 0;
    int failures = 0;
    long input_tokens = 0;
    long output_tokens = 0;
    double window_duration = 0;

    double avg_response_time = 0;
    double requests_per_second = 0;
    double output_token_throughput = 0;
    double combined_token_throughput = 0;
    double success_rate = 0;

    static RunMetrics from_run(const LevelRun& run, FailedTokenPolicy policy);
};

struct MetricSummary {
    double mean = 0;
    double stdev = 0;

    // Sample standard deviation; zero when fewer than two values
    static MetricSummary from_values(const std::vector<double>& values);
};

struct LevelSummary {
    int concurrency = 0;
    int requests = 0;
    int repetitions = 0;
    int truncated_runs = 0;
    int exhausted_runs = 0;
    // Repetitions that threw and were left out of the statistics
    int failed_repetitions = 0;

    MetricSummary response_time;
    MetricSummary throughput;
    MetricSummary output_token_throughput;
    MetricSummary combined_token_throughput;
    MetricSummary success_rate;

    // Always rebuilt from the complete list of runs
    static LevelSummary from_runs(int concurrency, const std::vector<LevelRun>& runs, FailedTokenPolicy policy);
};

class SweepResult {
public:
    SweepResult(std::vector<LevelSummary> summaries, std::vector<LevelRun> runs)
        : summaries_(std::move(summaries)), runs_(std::move(runs)) {}

    const std::vector<LevelSummary>& summaries() const {
        return summaries_;
    }

    // Raw runs of every level in sweep order; empty unless retained
    const std::vector<LevelRun>& runs() const {
        return runs_;
    }

    size_t size() const {
        return summaries_.size();
    }

private:
    std::vector<LevelSummary> summaries_;
    std::vector<LevelRun> runs_;
};
