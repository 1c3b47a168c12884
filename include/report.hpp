//
// Created by Sanger Steel on 6/18/25.
//

#pragma once
#include <optional>
#include <string>
#include "config.hpp"
#include "result_types.hpp"

struct ReportPaths {
    std::string summary_csv;
    std::optional<std::string> outcomes_jsonl;
};

const std::string& summary_csv_header();

std::string summary_csv_row(const LevelSummary& summary);

// One row per level, in sweep order
void write_summary_csv(const SweepResult& result, const std::string& path);

// One JSON object per request outcome, tagged with its level and repetition
void write_outcomes_jsonl(const SweepResult& result, const std::string& path);

std::string format_summary_table(const SweepResult& result);

// Creates the directory if needed and checks it is writable. Throws
// std::runtime_error otherwise.
void prepare_output_dir(const std::string& dir);

std::string timestamp_now();

ReportPaths write_report(const SweepResult& result, const SweepConfig& cfg, const std::string& timestamp);
