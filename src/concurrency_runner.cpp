//
// Created by Sanger Steel on 6/16/25.
//

#include "concurrency_runner.hpp"
#include <algorithm>
#include <atomic>
#include <format>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>
#include "logger.hpp"
#include "ring_buffers.hpp"

constexpr auto collector_poll_interval = std::chrono::microseconds(200);

using OutcomeChannel = MPSCRingBuffer<RequestOutcome, OutcomeRingBufferMaxSize>;

RunBudget RunBudget::for_level(const SweepConfig& cfg, int concurrency) {
    RunBudget budget;
    if (cfg.run_duration_s > 0) {
        budget.duration = seconds_d(cfg.run_duration_s);
    }
    if (cfg.run_deadline_s > 0) {
        budget.deadline = seconds_d(cfg.run_deadline_s);
    }
    if (cfg.requests_per_run > 0) {
        budget.requests = cfg.requests_per_run;
    } else if (!budget.duration.has_value()) {
        budget.requests = concurrency;
    }
    return budget;
}

int RunBudget::workers_for(int concurrency) const {
    if (requests > 0) {
        return std::min(concurrency, requests);
    }
    return concurrency;
}

bool is_retryable(const RequestOutcome& outcome) {
    if (outcome.success || !outcome.error.has_value()) {
        return false;
    }
    switch (outcome.error.value()) {
        case ErrorKind::TIMEOUT:
        case ErrorKind::TRANSPORT_ERROR:
            return true;
        case ErrorKind::ENDPOINT_ERROR:
            return outcome.http_status == 429 || outcome.http_status >= 500;
        default:
            return false;
    }
}

ConcurrencyRunner::ConcurrencyRunner(const RequestExecutor& executor, int warmup_requests, int max_retries)
    : executor(executor), warmup(warmup_requests), max_retries(max_retries),
      launch_worker([](std::function<void()> work) { return std::thread(std::move(work)); }) {
    if (warmup_requests < 0 || max_retries < 0) {
        throw std::invalid_argument("Warm-up and retry counts can't be negative");
    }
}

RequestOutcome ConcurrencyRunner::execute_with_retries(const PromptRecord& prompt, const CancellationToken& token) const {
    int attempts = 1;
    auto outcome = executor.execute(prompt, token);
    while (attempts <= max_retries && is_retryable(outcome) && !token.cancelled()) {
        attempts++;
        Logger.requests_retried.fetch_add(1, std::memory_order_acq_rel);
        Logger.debug(std::format("Retrying {} (attempt {})", prompt.id, attempts));
        outcome = executor.execute(prompt, token);
    }
    outcome.attempts = attempts;
    return outcome;
}

LevelRun ConcurrencyRunner::run(
    int concurrency,
    int repetition,
    const RunBudget& budget,
    PromptPool& warmup_pool,
    PromptPool& pool
) const {
    if (concurrency <= 0) {
        throw std::invalid_argument(std::format("Concurrency must be positive, got {}", concurrency));
    }
    if (budget.requests <= 0 && !budget.duration.has_value()) {
        throw std::invalid_argument("A run needs a request count or a duration bound");
    }

    if (warmup > 0) {
        Logger.info(std::format("Performing {} warm-up requests at concurrency {}..", warmup, concurrency));
        auto warmup_run = run_phase(concurrency, RunBudget::of_requests(warmup), warmup_pool, true);
        auto successes = std::count_if(warmup_run.outcomes.begin(), warmup_run.outcomes.end(),
                                       [](const RequestOutcome& o) { return o.success; });
        Logger.info(std::format("Warm-up complete: {}/{} successful requests", successes, warmup_run.dispatched));
    }

    auto level_run = run_phase(concurrency, budget, pool, false);
    level_run.repetition = repetition;
    return level_run;
}

// Workers claim dispatch slots from a shared counter and replace their own
// request as soon as it returns, so `concurrency` requests stay in flight
// until the budget runs out. Outcomes travel to this thread over an MPSC
// channel; it is the only writer of the LevelRun.
LevelRun ConcurrencyRunner::run_phase(int concurrency, const RunBudget& budget, PromptPool& pool, bool is_warmup) const {
    LevelRun level_run;
    level_run.concurrency = concurrency;

    auto channel = std::make_unique<OutcomeChannel>();
    CancellationToken token;
    std::atomic<int> next_slot = 0;
    std::atomic<int> dispatched = 0;
    std::atomic<bool> prompts_exhausted = false;

    const int num_workers = budget.workers_for(concurrency);
    std::atomic<int> active_workers = num_workers;
    level_run.started = steady::now();
    const auto started = level_run.started;

    auto request_worker_closure = [&] {
        try {
            while (!token.cancelled()) {
                if (budget.duration.has_value() && steady::now() - started >= budget.duration.value()) {
                    break;
                }
                auto slot = next_slot.fetch_add(1, std::memory_order_acq_rel);
                if (budget.requests > 0 && slot >= budget.requests) {
                    break;
                }

                PromptRecord prompt;
                try {
                    prompt = pool.claim();
                } catch (const std::exception& e) {
                    if (!prompts_exhausted.exchange(true, std::memory_order_acq_rel)) {
                        Logger.warn(std::format("Prompt source ran dry at concurrency {}: {}", concurrency, e.what()));
                    }
                    break;
                }

                dispatched.fetch_add(1, std::memory_order_acq_rel);
                if (is_warmup) {
                    Logger.warmup_requests.fetch_add(1, std::memory_order_acq_rel);
                } else {
                    Logger.requests_dispatched.fetch_add(1, std::memory_order_acq_rel);
                }

                auto outcome = execute_with_retries(prompt, token);
                if (channel->push(outcome) == RingState::FULL) {
                    Logger.channel_full_waits.fetch_add(1, std::memory_order_acq_rel);
                    channel->push_blocking(std::move(outcome));
                }
            }
        } catch (const std::exception& e) {
            Logger.error(std::format("Worker thread crashed: {}", e.what()));
        }
        active_workers.fetch_sub(1, std::memory_order_acq_rel);
    };

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    try {
        for (int i = 0; i < num_workers; ++i) {
            workers.emplace_back(launch_worker(request_worker_closure));
        }
    } catch (const std::system_error& e) {
        // The workers already running hold references into this frame
        token.cancel();
        active_workers.fetch_sub(num_workers - static_cast<int>(workers.size()), std::memory_order_acq_rel);
        while (active_workers.load(std::memory_order_acquire) > 0) {
            channel->fetch();
            std::this_thread::sleep_for(collector_poll_interval);
        }
        for (auto& worker: workers) {
            worker.join();
        }
        throw std::runtime_error(std::format("Could only start {} of {} workers at concurrency {}: {}",
                                             workers.size(), num_workers, concurrency, e.what()));
    }

    while (true) {
        auto fetched = channel->fetch();
        if (fetched.state == RingState::SUCCESS) {
            level_run.outcomes.emplace_back(std::move(fetched.content.value()));
            if (!is_warmup) {
                Logger.outcomes_collected.fetch_add(1, std::memory_order_acq_rel);
            }
            continue;
        }
        if (budget.deadline.has_value() && !token.cancelled()
            && steady::now() - started >= budget.deadline.value()) {
            Logger.warn(std::format("Run at concurrency {} hit its {:.1f}s deadline, cancelling in-flight requests",
                                    concurrency, budget.deadline.value().count()));
            token.cancel();
            level_run.deadline_truncated = true;
        }
        // Every push has landed once all workers are gone
        if (active_workers.load(std::memory_order_acquire) == 0 && channel->is_empty()) {
            break;
        }
        std::this_thread::sleep_for(collector_poll_interval);
    }

    for (auto& worker: workers) {
        worker.join();
    }

    level_run.dispatched = dispatched.load(std::memory_order_acquire);
    level_run.prompts_exhausted = prompts_exhausted.load(std::memory_order_acquire);
    level_run.wall_duration = seconds_between(started, steady::now());
    if (!level_run.complete()) {
        throw std::logic_error(std::format("Run sealed with {} outcomes for {} dispatched requests",
                                           level_run.outcomes.size(), level_run.dispatched));
    }
    Logger.dump_debugging_state();
    return level_run;
}
