//
// Created by Sanger Steel on 6/17/25.
//

#pragma once
#include <stdexcept>
#include <string>
#include "config.hpp"
#include "result_types.hpp"
#include "trial_aggregator.hpp"
#include "transport.hpp"

// The sweep can't start at all (endpoint unreachable). Fatal.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

class ScalingSweeper {
public:
    ScalingSweeper(RequestTransportStrategy& transport, const TrialAggregator& aggregator, const SweepConfig& cfg);

    // Throws SetupError when nothing answers at the endpoint
    void preflight() const;

    // Validates the config, runs the pre-flight check, then every level in
    // configured order. Per-level failures land in the result as data.
    SweepResult sweep() const;

private:
    RequestTransportStrategy& transport;
    const TrialAggregator& aggregator;
    const SweepConfig& cfg;
};
