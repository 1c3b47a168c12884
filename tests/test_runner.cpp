//
// Created by Sanger Steel on 6/18/25.
//

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "../include/concurrency_runner.hpp"
#include "../include/request_executor.hpp"
#include "../include/scaling_sweeper.hpp"
#include "../include/trial_aggregator.hpp"
#include "mock_transport.hpp"

using Catch::Approx;

namespace {

RequestParameters chat_defaults() {
    RequestParameters req;
    req.model = "mock-model";
    req.format = EndpointFormat::CHAT;
    return req;
}

SweepConfig mock_config() {
    SweepConfig cfg;
    cfg.transport.url = "mock://localhost/v1/chat/completions";
    cfg.concurrency_levels = {1, 2, 4};
    cfg.repetitions = 3;
    cfg.warmup_requests = 2;
    cfg.requests_per_run = 10;
    cfg.break_between_levels_s = 0;
    return cfg;
}

LevelRun run_once(const ConcurrencyRunner& runner, int concurrency, const RunBudget& budget) {
    CountingPromptSource source;
    PromptPool warmup_pool(source, static_cast<size_t>(runner.warmup_requests()), PoolExhaustion::EXTEND);
    PromptPool pool(source, 100, PoolExhaustion::CYCLE);
    return runner.run(concurrency, 1, budget, warmup_pool, pool);
}

// Throws on the n-th generate() call, simulating a level that can't start
class FailingPromptSource final : public PromptSource {
public:
    explicit FailingPromptSource(int fail_on_call) : fail_on_call(fail_on_call) {}

    std::vector<PromptRecord> generate(size_t count) override {
        if (++calls == fail_on_call) {
            throw std::runtime_error("prompt source unavailable");
        }
        return inner.generate(count);
    }

private:
    CountingPromptSource inner;
    int fail_on_call;
    int calls = 0;
};

// Starts real threads until `limit` have been launched, then refuses like an
// exhausted process would
WorkerLauncher limited_launcher(int limit, std::shared_ptr<std::atomic<int>> launched) {
    return [limit, launched](std::function<void()> work) {
        if (launched->fetch_add(1) >= limit) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::thread(std::move(work));
    };
}

}


TEST_CASE( "Executor reports a successful completion with usage" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    CancellationToken token;

    auto outcome = executor.execute(PromptRecord{"p0", "hello there", 10}, token);
    REQUIRE(outcome.success);
    REQUIRE_FALSE(outcome.error.has_value());
    REQUIRE(outcome.id == "p0");
    REQUIRE(outcome.output_tokens == 50);
    REQUIRE(outcome.input_tokens == 20);
    REQUIRE_FALSE(outcome.tokens_estimated);
    REQUIRE(outcome.http_status == 200);
    REQUIRE(outcome.ttfb == Approx(0.01));
    REQUIRE(outcome.elapsed >= 0.009);
    REQUIRE(outcome.end >= outcome.start);
}

TEST_CASE( "Executor estimates tokens when usage is missing" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->reports_usage = false;
    RequestExecutor executor(mock, chat_defaults());
    CancellationToken token;

    auto outcome = executor.execute(PromptRecord{"p0", "one two", 10}, token);
    REQUIRE(outcome.success);
    REQUIRE(outcome.tokens_estimated);
    REQUIRE(outcome.output_tokens == 4);
    REQUIRE(outcome.input_tokens == 2);
}

TEST_CASE( "Executor classifies failures" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    CancellationToken token;
    PromptRecord prompt{"p0", "hello", 10};

    SECTION( "server error" ) {
        mock->fail_every = 1;
        mock->fail_status = 503;
        auto outcome = executor.execute(prompt, token);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error.value() == ErrorKind::ENDPOINT_ERROR);
        REQUIRE(outcome.http_status == 503);
        REQUIRE(outcome.error_message.starts_with("HTTP 503"));
        REQUIRE(outcome.output_tokens == 0);
    }
    SECTION( "unparseable body" ) {
        mock->body_override = "<html>gateway</html>";
        auto outcome = executor.execute(prompt, token);
        REQUIRE(outcome.error.value() == ErrorKind::PARSE_ERROR);
    }
    SECTION( "cancelled mid-flight" ) {
        mock->delay = std::chrono::milliseconds(5'000);
        token.cancel();
        auto outcome = executor.execute(prompt, token);
        REQUIRE(outcome.error.value() == ErrorKind::TIMEOUT);
        REQUIRE(outcome.elapsed < 1.0);
    }
    SECTION( "transport throws" ) {
        mock->throw_on_send = true;
        auto outcome = executor.execute(prompt, token);
        REQUIRE(outcome.error.value() == ErrorKind::TRANSPORT_ERROR);
        REQUIRE(outcome.error_message == "mock transport exploded");
    }
}

TEST_CASE( "Transport statuses map onto error kinds" ) {
    PromptRecord prompt{"p0", "hello", 10};
    TransportResponse response;

    RequestOutcome timed_out;
    response.status = TransportStatus::TIMED_OUT;
    classify_response(timed_out, response, prompt, EndpointFormat::CHAT);
    REQUIRE(timed_out.error.value() == ErrorKind::TIMEOUT);

    RequestOutcome refused;
    response.status = TransportStatus::FAILED;
    response.error_message = "Couldn't connect to server";
    classify_response(refused, response, prompt, EndpointFormat::CHAT);
    REQUIRE(refused.error.value() == ErrorKind::TRANSPORT_ERROR);
    REQUIRE(refused.error_message == "Couldn't connect to server");

    RequestOutcome not_found;
    response.status = TransportStatus::OK;
    response.http_status = 404;
    response.body = std::string(1'000, 'x');
    classify_response(not_found, response, prompt, EndpointFormat::CHAT);
    REQUIRE(not_found.error.value() == ErrorKind::ENDPOINT_ERROR);
    REQUIRE(not_found.error_message.size() < 300);
}

TEST_CASE( "Executor needs a transport" ) {
    REQUIRE_THROWS_AS(RequestExecutor(nullptr, chat_defaults()), std::invalid_argument);
}


TEST_CASE( "Run budget follows the config" ) {
    SweepConfig cfg;
    auto budget = RunBudget::for_level(cfg, 8);
    REQUIRE(budget.requests == 8);
    REQUIRE_FALSE(budget.duration.has_value());
    REQUIRE(budget.workers_for(8) == 8);

    cfg.requests_per_run = 3;
    budget = RunBudget::for_level(cfg, 8);
    REQUIRE(budget.requests == 3);
    REQUIRE(budget.workers_for(8) == 3);

    cfg.requests_per_run = 0;
    cfg.run_duration_s = 2;
    cfg.run_deadline_s = 5;
    budget = RunBudget::for_level(cfg, 8);
    REQUIRE(budget.requests == 0);
    REQUIRE(budget.duration.value().count() == Approx(2));
    REQUIRE(budget.deadline.value().count() == Approx(5));
    REQUIRE(budget.workers_for(8) == 8);
}

TEST_CASE( "Runner collects one outcome per dispatched request" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(50);
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 2);

    auto run = run_once(runner, 4, RunBudget::of_requests(10));
    REQUIRE(run.complete());
    REQUIRE(run.dispatched == 10);
    REQUIRE(run.outcomes.size() == 10);
    REQUIRE(run.concurrency == 4);
    REQUIRE(run.repetition == 1);
    REQUIRE_FALSE(run.deadline_truncated);
    // Warm-up requests hit the endpoint but never reach the run
    REQUIRE(mock->calls.load() == 12);
    REQUIRE(mock->max_in_flight.load() == 4);
    for (const auto& outcome: run.outcomes) {
        REQUIRE(outcome.success);
    }
    // 10 requests of 50ms on 4 workers take at least 3 waves
    REQUIRE(run.wall_duration >= 0.14);
}

TEST_CASE( "Runner never exceeds the concurrency level" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(20);
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    auto run = run_once(runner, 3, RunBudget::of_requests(30));
    REQUIRE(run.outcomes.size() == 30);
    REQUIRE(mock->max_in_flight.load() <= 3);
}

TEST_CASE( "Fewer requests than the concurrency level" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    auto run = run_once(runner, 16, RunBudget::of_requests(3));
    REQUIRE(run.dispatched == 3);
    REQUIRE(run.outcomes.size() == 3);
    REQUIRE(mock->max_in_flight.load() <= 3);
}

TEST_CASE( "A run with every request failing still completes" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->fail_every = 1;
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    auto run = run_once(runner, 2, RunBudget::of_requests(6));
    REQUIRE(run.complete());
    REQUIRE(run.outcomes.size() == 6);
    auto metrics = RunMetrics::from_run(run, FailedTokenPolicy::EXCLUDE);
    REQUIRE(metrics.successes == 0);
    REQUIRE(metrics.success_rate == 0);
    REQUIRE(metrics.requests_per_second == 0);
    REQUIRE(metrics.output_token_throughput == 0);
    REQUIRE(metrics.avg_response_time == 0);
}

TEST_CASE( "Deadline cancels in-flight requests" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(5'000);
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    auto budget = RunBudget::of_requests(10);
    budget.deadline = seconds_d(0.2);
    auto run = run_once(runner, 2, budget);

    REQUIRE(run.deadline_truncated);
    REQUIRE(run.complete());
    REQUIRE(run.dispatched == 2);
    REQUIRE(run.wall_duration < 2.0);
    for (const auto& outcome: run.outcomes) {
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error.value() == ErrorKind::TIMEOUT);
    }
}

TEST_CASE( "Duration bound stops dispatching" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(20);
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    RunBudget budget;
    budget.duration = seconds_d(0.2);
    auto run = run_once(runner, 2, budget);
    REQUIRE(run.complete());
    REQUIRE(run.dispatched > 2);
    REQUIRE_FALSE(run.deadline_truncated);
    REQUIRE(run.wall_duration < 1.0);
}

TEST_CASE( "Workers stop when prompts run out" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    CountingPromptSource dry_source(3);
    PromptPool warmup_pool(dry_source, 0, PoolExhaustion::EXTEND);
    PromptPool pool(dry_source, 3, PoolExhaustion::EXTEND);
    auto run = runner.run(2, 1, RunBudget::of_requests(5), warmup_pool, pool);
    REQUIRE(run.complete());
    REQUIRE(run.dispatched == 3);
    REQUIRE(run.prompts_exhausted);

    auto summary = LevelSummary::from_runs(2, {run}, FailedTokenPolicy::EXCLUDE);
    REQUIRE(summary.exhausted_runs == 1);
}

TEST_CASE( "A run that spends its budget is not marked short of prompts" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);

    auto run = run_once(runner, 2, RunBudget::of_requests(5));
    REQUIRE(run.dispatched == 5);
    REQUIRE_FALSE(run.prompts_exhausted);
}

TEST_CASE( "Runner joins started workers when a thread can't be spawned" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(2'000);
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0);
    auto launched = std::make_shared<std::atomic<int>>(0);
    runner.set_worker_launcher(limited_launcher(2, launched));

    auto started = steady::now();
    REQUIRE_THROWS_AS(run_once(runner, 4, RunBudget::of_requests(8)), std::runtime_error);
    // The two running workers were cancelled rather than waited out
    REQUIRE(seconds_between(started, steady::now()) < 1.5);
    REQUIRE(launched->load() == 3);
    REQUIRE(mock->in_flight.load() == 0);
}

TEST_CASE( "Retryable failures are retried" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->fail_first = 2;
    mock->fail_status = 503;
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0, 3);

    auto run = run_once(runner, 1, RunBudget::of_requests(1));
    REQUIRE(run.outcomes.size() == 1);
    REQUIRE(run.outcomes[0].success);
    REQUIRE(run.outcomes[0].attempts == 3);
    REQUIRE(mock->calls.load() == 3);
}

TEST_CASE( "Client errors are not retried" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->fail_first = 1;
    mock->fail_status = 400;
    RequestExecutor executor(mock, chat_defaults());
    ConcurrencyRunner runner(executor, 0, 3);

    auto run = run_once(runner, 1, RunBudget::of_requests(1));
    REQUIRE_FALSE(run.outcomes[0].success);
    REQUIRE(run.outcomes[0].attempts == 1);
    REQUIRE(mock->calls.load() == 1);
}

TEST_CASE( "Runner rejects unusable arguments" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    REQUIRE_THROWS_AS(ConcurrencyRunner(executor, -1), std::invalid_argument);

    ConcurrencyRunner runner(executor, 0);
    REQUIRE_THROWS_AS(run_once(runner, 0, RunBudget::of_requests(1)), std::invalid_argument);
    REQUIRE_THROWS_AS(run_once(runner, 1, RunBudget{}), std::invalid_argument);
}


TEST_CASE( "Aggregator averages repetitions of one level" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(100);
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    ConcurrencyRunner runner(executor, cfg.warmup_requests);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);

    auto aggregate = aggregator.aggregate(2);
    REQUIRE(aggregate.runs.size() == 3);
    REQUIRE(mock->calls.load() == 3 * (2 + 10));

    const auto& summary = aggregate.summary;
    REQUIRE(summary.concurrency == 2);
    REQUIRE(summary.repetitions == 3);
    REQUIRE(summary.requests == 10);
    REQUIRE(summary.success_rate.mean == Approx(1.0));
    REQUIRE(summary.success_rate.stdev == Approx(0.0));
    REQUIRE(summary.response_time.mean >= 0.1);
    REQUIRE(summary.response_time.mean < 0.5);
    // Two in flight at 100ms each is at most 20 req/s
    REQUIRE(summary.throughput.mean > 0);
    REQUIRE(summary.throughput.mean <= 20.5);
    REQUIRE(summary.output_token_throughput.mean == Approx(summary.throughput.mean * 50).epsilon(0.01));
    REQUIRE(summary.combined_token_throughput.mean == Approx(summary.throughput.mean * 70).epsilon(0.01));
    REQUIRE(summary.throughput.stdev >= 0);
}

TEST_CASE( "A single repetition has no spread" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.repetitions = 1;
    ConcurrencyRunner runner(executor, 0);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);

    auto summary = aggregator.aggregate(4).summary;
    REQUIRE(summary.repetitions == 1);
    REQUIRE(summary.response_time.stdev == 0);
    REQUIRE(summary.throughput.stdev == 0);
    REQUIRE(summary.success_rate.stdev == 0);
}

TEST_CASE( "A failed repetition keeps the ones that finished" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.repetitions = 3;
    cfg.warmup_requests = 0;
    cfg.requests_per_run = 2;
    ConcurrencyRunner runner(executor, 0);
    FailingPromptSource prompts(3);
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);

    auto aggregate = aggregator.aggregate(2);
    REQUIRE(aggregate.runs.size() == 2);
    REQUIRE(aggregate.runs[0].repetition == 1);
    REQUIRE(aggregate.runs[1].repetition == 2);
    REQUIRE(aggregate.summary.repetitions == 2);
    REQUIRE(aggregate.summary.failed_repetitions == 1);
    REQUIRE(aggregate.summary.success_rate.mean == Approx(1.0));
}

TEST_CASE( "Aggregator survives a repetition whose workers can't start" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.repetitions = 2;
    cfg.warmup_requests = 0;
    cfg.requests_per_run = 2;
    ConcurrencyRunner runner(executor, 0);
    // Enough threads for the first repetition only
    auto launched = std::make_shared<std::atomic<int>>(0);
    runner.set_worker_launcher(limited_launcher(2, launched));
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);

    auto summary = aggregator.aggregate(2).summary;
    REQUIRE(summary.repetitions == 1);
    REQUIRE(summary.failed_repetitions == 1);
    REQUIRE(mock->in_flight.load() == 0);
}

TEST_CASE( "Every third request failing" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->fail_every = 3;
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.repetitions = 1;
    cfg.warmup_requests = 0;
    cfg.requests_per_run = 30;
    ConcurrencyRunner runner(executor, 0);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);

    auto summary = aggregator.aggregate(3).summary;
    REQUIRE(summary.success_rate.mean == Approx(20.0 / 30.0));
    REQUIRE(summary.requests == 30);
}

TEST_CASE( "No successes at a level yields zeroed metrics" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->fail_every = 1;
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.repetitions = 2;
    cfg.warmup_requests = 0;
    ConcurrencyRunner runner(executor, 0);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);

    auto summary = aggregator.aggregate(2).summary;
    REQUIRE(summary.repetitions == 2);
    REQUIRE(summary.success_rate.mean == 0);
    REQUIRE(summary.response_time.mean == 0);
    REQUIRE(summary.throughput.mean == 0);
    REQUIRE(summary.output_token_throughput.mean == 0);
}


TEST_CASE( "Sweeper runs levels in configured order" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.concurrency_levels = {4, 1, 2};
    cfg.repetitions = 1;
    cfg.warmup_requests = 0;
    cfg.requests_per_run = 4;
    ConcurrencyRunner runner(executor, 0);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);
    ScalingSweeper sweeper(*mock, aggregator, cfg);

    auto first = sweeper.sweep();
    REQUIRE(first.size() == 3);
    REQUIRE(first.summaries()[0].concurrency == 4);
    REQUIRE(first.summaries()[1].concurrency == 1);
    REQUIRE(first.summaries()[2].concurrency == 2);
    REQUIRE(first.runs().size() == 3);

    auto second = sweeper.sweep();
    REQUIRE(second.size() == first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(second.summaries()[i].concurrency == first.summaries()[i].concurrency);
        REQUIRE(second.summaries()[i].requests == first.summaries()[i].requests);
        REQUIRE(second.summaries()[i].success_rate.mean == first.summaries()[i].success_rate.mean);
    }
}

TEST_CASE( "A failing level does not abort the sweep" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.repetitions = 1;
    cfg.warmup_requests = 0;
    cfg.requests_per_run = 2;
    ConcurrencyRunner runner(executor, 0);
    FailingPromptSource prompts(2);
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);
    ScalingSweeper sweeper(*mock, aggregator, cfg);

    auto result = sweeper.sweep();
    REQUIRE(result.size() == 3);
    REQUIRE(result.summaries()[0].repetitions == 1);
    REQUIRE(result.summaries()[1].concurrency == 2);
    REQUIRE(result.summaries()[1].repetitions == 0);
    REQUIRE(result.summaries()[2].repetitions == 1);
    REQUIRE(result.summaries()[2].success_rate.mean == Approx(1.0));
}

TEST_CASE( "Unreachable endpoint fails before any load" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->reachable = false;
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    ConcurrencyRunner runner(executor, cfg.warmup_requests);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);
    ScalingSweeper sweeper(*mock, aggregator, cfg);

    REQUIRE_THROWS_AS(sweeper.sweep(), SetupError);
    REQUIRE(mock->calls.load() == 0);
}

TEST_CASE( "Invalid config fails before any load" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.concurrency_levels = {2, -1};
    ConcurrencyRunner runner(executor, 0);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);
    ScalingSweeper sweeper(*mock, aggregator, cfg);

    REQUIRE_THROWS_AS(sweeper.sweep(), ConfigError);
    REQUIRE(mock->calls.load() == 0);
}

TEST_CASE( "Sweeper pauses between levels" ) {
    auto mock = std::make_shared<MockTransport>();
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    cfg.concurrency_levels = {1, 1};
    cfg.repetitions = 1;
    cfg.warmup_requests = 0;
    cfg.requests_per_run = 1;
    cfg.break_between_levels_s = 0.3;
    ConcurrencyRunner runner(executor, 0);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);
    ScalingSweeper sweeper(*mock, aggregator, cfg);

    auto start = steady::now();
    auto result = sweeper.sweep();
    REQUIRE(result.size() == 2);
    REQUIRE(seconds_between(start, steady::now()) >= 0.3);
}

TEST_CASE( "Three level sweep against a 100ms endpoint" ) {
    auto mock = std::make_shared<MockTransport>();
    mock->delay = std::chrono::milliseconds(100);
    RequestExecutor executor(mock, chat_defaults());
    auto cfg = mock_config();
    ConcurrencyRunner runner(executor, cfg.warmup_requests);
    CountingPromptSource prompts;
    CountingPromptSource warmup_prompts;
    TrialAggregator aggregator(runner, prompts, warmup_prompts, cfg);
    ScalingSweeper sweeper(*mock, aggregator, cfg);

    auto result = sweeper.sweep();
    REQUIRE(result.size() == 3);
    REQUIRE(result.runs().size() == 9);
    REQUIRE(mock->calls.load() == 3 * 3 * (2 + 10));
    for (const auto& summary: result.summaries()) {
        REQUIRE(summary.repetitions == 3);
        REQUIRE(summary.requests == 10);
        REQUIRE(summary.success_rate.mean == Approx(1.0));
        REQUIRE(summary.response_time.mean == Approx(0.1).margin(0.05));
        REQUIRE(summary.throughput.mean > 0);
        REQUIRE(summary.throughput.mean <= summary.concurrency / 0.1 + 0.5);
    }
    for (const auto& run: result.runs()) {
        REQUIRE(run.outcomes.size() == 10);
    }
}
