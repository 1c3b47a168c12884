//
// Created by Sanger Steel on 6/17/25.
//

#pragma once
#include <vector>
#include "concurrency_runner.hpp"
#include "config.hpp"
#include "prompts.hpp"
#include "result_types.hpp"

struct LevelAggregate {
    LevelSummary summary;
    std::vector<LevelRun> runs;
};

// Repeats one concurrency level and digests the repetitions. Metrics are
// derived per repetition first, then averaged across repetitions, so the
// spread between runs survives as the standard deviation.
class TrialAggregator {
public:
    TrialAggregator(
        const ConcurrencyRunner& runner,
        PromptSource& prompt_source,
        PromptSource& warmup_source,
        const SweepConfig& cfg
    );

    // A repetition that throws is logged and left out of the summary. Throws
    // only when no repetition finished.
    LevelAggregate aggregate(int concurrency) const;

private:
    const ConcurrencyRunner& runner;
    PromptSource& prompt_source;
    PromptSource& warmup_source;
    const SweepConfig& cfg;
};

std::string describe_run(const LevelRun& run, const RunMetrics& metrics);
