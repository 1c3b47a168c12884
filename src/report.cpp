//
// Created by Sanger Steel on 6/18/25.
//

#include "report.hpp"
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include "logger.hpp"

namespace fs = std::filesystem;

const std::string& summary_csv_header() {
    static const std::string header =
        "concurrency,requests,repetitions,"
        "mean_response_time,stdev_response_time,"
        "mean_throughput,stdev_throughput,"
        "mean_output_token_throughput,stdev_output_token_throughput,"
        "mean_combined_token_throughput,stdev_combined_token_throughput,"
        "mean_success_rate,stdev_success_rate";
    return header;
}

std::string summary_csv_row(const LevelSummary& summary) {
    return std::format("{},{},{},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f}",
                       summary.concurrency, summary.requests, summary.repetitions,
                       summary.response_time.mean, summary.response_time.stdev,
                       summary.throughput.mean, summary.throughput.stdev,
                       summary.output_token_throughput.mean, summary.output_token_throughput.stdev,
                       summary.combined_token_throughput.mean, summary.combined_token_throughput.stdev,
                       summary.success_rate.mean, summary.success_rate.stdev);
}

void write_summary_csv(const SweepResult& result, const std::string& path) {
    std::ofstream outfile(path);
    if (!outfile.is_open()) {
        throw std::runtime_error(std::format("failed to open output file {}", path));
    }
    outfile << summary_csv_header() << '\n';
    for (const auto& summary: result.summaries()) {
        outfile << summary_csv_row(summary) << '\n';
    }
    if (!outfile) {
        throw std::runtime_error(std::format("failed writing {}", path));
    }
}

void write_outcomes_jsonl(const SweepResult& result, const std::string& path) {
    std::ofstream outfile(path);
    if (!outfile.is_open()) {
        throw std::runtime_error(std::format("failed to open output file {}", path));
    }
    for (const auto& run: result.runs()) {
        for (const auto& outcome: run.outcomes) {
            auto jsonl = outcome.to_json(run.started);
            jsonl["concurrency"] = run.concurrency;
            jsonl["repetition"] = run.repetition;
            jsonl["test_duration"] = run.wall_duration;
            jsonl["deadline_truncated"] = run.deadline_truncated;
            jsonl["prompts_exhausted"] = run.prompts_exhausted;
            outfile << jsonl.dump() << '\n';
        }
    }
    if (!outfile) {
        throw std::runtime_error(std::format("failed writing {}", path));
    }
}

std::string format_summary_table(const SweepResult& result) {
    const char* test_type = result.size() > 1 ? "SCALING" : "STANDARD";
    std::string table = std::format("===== {} TEST SUMMARY (AVERAGED ACROSS REPETITIONS) =====\n", test_type);
    table += "Concurrency | Success Rate | Mean Response Time (s) | Throughput (req/s) | Output tok/s\n";
    table += "------------|--------------|------------------------|--------------------|-------------\n";
    for (const auto& s: result.summaries()) {
        table += std::format("{:11d} | {:11.2f}% | {:13.2f} ± {:6.2f} | {:8.2f} ± {:7.2f} | {:8.2f}",
                             s.concurrency, s.success_rate.mean * 100,
                             s.response_time.mean, s.response_time.stdev,
                             s.throughput.mean, s.throughput.stdev,
                             s.output_token_throughput.mean);
        if (s.repetitions == 0) {
            table += "  (aborted)";
        } else {
            if (s.truncated_runs > 0) {
                table += std::format("  ({} truncated)", s.truncated_runs);
            }
            if (s.exhausted_runs > 0) {
                table += std::format("  ({} short of prompts)", s.exhausted_runs);
            }
            if (s.failed_repetitions > 0) {
                table += std::format("  ({} failed)", s.failed_repetitions);
            }
        }
        table += "\n";
    }
    return table;
}

void prepare_output_dir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error(std::format("Could not create output directory {}: {}", dir, ec.message()));
    }
    auto probe_path = fs::path(dir) / ".ramp_write_check";
    {
        std::ofstream probe(probe_path);
        if (!probe.is_open()) {
            throw std::runtime_error(std::format("Output directory {} is not writable", dir));
        }
    }
    fs::remove(probe_path, ec);
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
    return buf;
}

ReportPaths write_report(const SweepResult& result, const SweepConfig& cfg, const std::string& timestamp) {
    ReportPaths paths;
    const char* prefix = result.size() > 1 ? "scaling_test" : "load_test";
    paths.summary_csv = (fs::path(cfg.output_dir) / std::format("{}_{}_summary.csv", prefix, timestamp)).string();
    write_summary_csv(result, paths.summary_csv);
    Logger.info(std::format("Summary saved to {}", paths.summary_csv));

    if (cfg.write_outcomes) {
        auto outcomes_path = (fs::path(cfg.output_dir) / std::format("{}_{}_outcomes.jsonl", prefix, timestamp)).string();
        write_outcomes_jsonl(result, outcomes_path);
        Logger.info(std::format("Per-request outcomes saved to {}", outcomes_path));
        paths.outcomes_jsonl = outcomes_path;
    }
    return paths;
}
