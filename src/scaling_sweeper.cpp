//
// Created by Sanger Steel on 6/17/25.
//

#include "scaling_sweeper.hpp"
#include <format>
#include <thread>
#include "logger.hpp"

ScalingSweeper::ScalingSweeper(RequestTransportStrategy& transport, const TrialAggregator& aggregator, const SweepConfig& cfg)
    : transport(transport), aggregator(aggregator), cfg(cfg) {
}

void ScalingSweeper::preflight() const {
    Logger.info(std::format("Checking that {} is reachable..", transport.endpoint()));
    TransportResponse response;
    try {
        response = transport.probe();
    } catch (const std::exception& e) {
        throw SetupError(std::format("Pre-flight check against {} failed: {}", transport.endpoint(), e.what()));
    }
    if (response.status != TransportStatus::OK) {
        throw SetupError(std::format("Endpoint {} is unreachable ({}): {}",
                                     transport.endpoint(),
                                     transport_status_as_str(response.status),
                                     response.error_message));
    }
    Logger.info(std::format("Endpoint answered with HTTP {}", response.http_status));
}

SweepResult ScalingSweeper::sweep() const {
    cfg.validate();
    preflight();

    std::vector<LevelSummary> summaries;
    std::vector<LevelRun> runs;
    const auto& levels = cfg.concurrency_levels;

    for (size_t i = 0; i < levels.size(); ++i) {
        auto concurrency = levels[i];
        Logger.info(std::format("===== Testing concurrency level: {} =====", concurrency));
        try {
            auto aggregate = aggregator.aggregate(concurrency);
            summaries.emplace_back(aggregate.summary);
            if (cfg.write_outcomes) {
                for (auto& run: aggregate.runs) {
                    runs.emplace_back(std::move(run));
                }
            }
        } catch (const std::exception& e) {
            Logger.error(std::format("Concurrency level {} aborted: {}", concurrency, e.what()));
            LevelSummary aborted;
            aborted.concurrency = concurrency;
            aborted.failed_repetitions = cfg.repetitions;
            summaries.emplace_back(aborted);
        }

        if (i + 1 < levels.size() && cfg.break_between_levels_s > 0) {
            Logger.info(std::format("Taking a {} second break between concurrency levels..", cfg.break_between_levels_s));
            std::this_thread::sleep_for(seconds_d(cfg.break_between_levels_s));
        }
    }
    return SweepResult(std::move(summaries), std::move(runs));
}
