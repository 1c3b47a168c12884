//
// Created by Sanger Steel on 6/17/25.
//

#include "trial_aggregator.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <stdexcept>
#include "logger.hpp"

TrialAggregator::TrialAggregator(
    const ConcurrencyRunner& runner,
    PromptSource& prompt_source,
    PromptSource& warmup_source,
    const SweepConfig& cfg
) : runner(runner), prompt_source(prompt_source), warmup_source(warmup_source), cfg(cfg) {
}

std::string describe_run(const LevelRun& run, const RunMetrics& metrics) {
    std::string str = std::format(
        "c={} rep={}: {}/{} ok ({:.2f}%) | mean response {:.4f}s | {:.4f} req/s"
        " | {:.2f} out tok/s | {:.2f} total tok/s | window {:.4f}s",
        run.concurrency, run.repetition, metrics.successes, metrics.total,
        metrics.success_rate * 100, metrics.avg_response_time, metrics.requests_per_second,
        metrics.output_token_throughput, metrics.combined_token_throughput, metrics.window_duration);
    if (run.deadline_truncated) {
        str += " | truncated by deadline";
    }
    if (run.prompts_exhausted) {
        str += std::format(" | prompts ran out after {} requests", run.dispatched);
    }
    return str;
}

LevelAggregate TrialAggregator::aggregate(int concurrency) const {
    LevelAggregate aggregate;
    auto budget = RunBudget::for_level(cfg, concurrency);

    size_t pool_size = cfg.prompts.pool_size;
    if (budget.requests > 0) {
        pool_size = std::min(pool_size, static_cast<size_t>(budget.requests));
    }

    int failed_repetitions = 0;
    for (int repetition = 1; repetition <= cfg.repetitions; ++repetition) {
        Logger.info(std::format("Running batch {}/{} with {} concurrent requests",
                                repetition, cfg.repetitions, concurrency));

        LevelRun run;
        try {
            // Fresh prompts every repetition so no run can hit a cache warmed by another
            PromptPool pool(prompt_source, pool_size, cfg.prompts.exhaustion);
            PromptPool warmup_pool(warmup_source, static_cast<size_t>(runner.warmup_requests()), PoolExhaustion::EXTEND);
            run = runner.run(concurrency, repetition, budget, warmup_pool, pool);
        } catch (const std::exception& e) {
            Logger.error(std::format("Batch {}/{} at concurrency {} failed: {}",
                                     repetition, cfg.repetitions, concurrency, e.what()));
            failed_repetitions++;
            continue;
        }

        auto metrics = RunMetrics::from_run(run, cfg.failed_token_policy);
        Logger.info(describe_run(run, metrics));

        if (metrics.failures > 0) {
            std::map<std::string, int> error_counts;
            for (const auto& outcome: run.outcomes) {
                if (outcome.error.has_value()) {
                    error_counts[error_kind_as_str(outcome.error.value())]++;
                }
            }
            for (const auto& [kind, count]: error_counts) {
                Logger.info(std::format("  {}: {}", kind, count));
            }
        }
        aggregate.runs.emplace_back(std::move(run));
    }

    if (aggregate.runs.empty()) {
        throw std::runtime_error(std::format("All {} batches at concurrency {} failed", cfg.repetitions, concurrency));
    }
    aggregate.summary = LevelSummary::from_runs(concurrency, aggregate.runs, cfg.failed_token_policy);
    aggregate.summary.failed_repetitions = failed_repetitions;
    return aggregate;
}
