//
// Created by Sanger Steel on 6/16/25.
//

#pragma once
#include <functional>
#include <optional>
#include <thread>
#include "config.hpp"
#include "prompts.hpp"
#include "request_executor.hpp"
#include "result_types.hpp"

// How much work one run may dispatch. Dispatch stops at whichever bound is
// hit first; a deadline additionally cancels what is still in flight.
struct RunBudget {
    // 0 = no request bound (a duration must be set)
    int requests = 0;
    std::optional<seconds_d> duration = std::nullopt;
    std::optional<seconds_d> deadline = std::nullopt;

    static RunBudget for_level(const SweepConfig& cfg, int concurrency);

    static RunBudget of_requests(int requests) {
        RunBudget budget;
        budget.requests = requests;
        return budget;
    }

    // Number of workers to keep busy for this budget at `concurrency`
    int workers_for(int concurrency) const;
};

// Timeouts, transport failures, throttling (429) and server errors (5xx)
// are worth another attempt; bad requests and unparseable bodies are not.
bool is_retryable(const RequestOutcome& outcome);

// Starts one worker thread of a phase. Throws std::system_error when the
// system refuses a thread, as std::thread does.
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

class ConcurrencyRunner {
public:
    ConcurrencyRunner(const RequestExecutor& executor, int warmup_requests, int max_retries = 0);

    // Warm-up at `concurrency` (outcomes discarded), then the measured phase.
    // Throws std::runtime_error if the workers for a phase can't be started;
    // any already running are cancelled and joined first.
    LevelRun run(int concurrency, int repetition, const RunBudget& budget, PromptPool& warmup_pool, PromptPool& pool) const;

    int warmup_requests() const {
        return warmup;
    }

    void set_worker_launcher(WorkerLauncher launcher) {
        launch_worker = std::move(launcher);
    }

private:
    LevelRun run_phase(int concurrency, const RunBudget& budget, PromptPool& pool, bool is_warmup) const;

    RequestOutcome execute_with_retries(const PromptRecord& prompt, const CancellationToken& token) const;

    const RequestExecutor& executor;
    int warmup;
    int max_retries;
    WorkerLauncher launch_worker;
};
