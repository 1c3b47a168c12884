//
// Created by Sanger Steel on 6/6/25.
//

#include <csignal>
#include <execinfo.h>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <unistd.h>
#include "concurrency_runner.hpp"
#include "config.hpp"
#include "curl.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "request_executor.hpp"
#include "scaling_sweeper.hpp"
#include "trial_aggregator.hpp"

const std::string filename = "stdout";
const std::string default_config_path = "ramp.yaml";

#ifdef NDEBUG
LoggingContext Logger(filename, INFO);
#else
LoggingContext Logger(filename, DEBUG);
#endif


const std::string_view help_text = R"(
Usage: ramp [<path-to-yaml>] [OPTIONS]

Runs every configured concurrency level against a completion endpoint and
writes a summary CSV (and per-request JSONL) to the output directory.
With no config path, ./ramp.yaml is used if present.

Options:
  --base-url <url>                 Endpoint URL (e.g. https://host/v1/chat/completions)
  --model <name>                   Model identifier sent with each request
  --concurrency-levels <a,b,c>     Comma-separated concurrency levels (default 2,4,8,16,32)
  --repetitions <int>              Repetitions per level (default 3)
  --warmup <int>                   Warm-up requests before each run (default 5)
  --requests <int>                 Requests per run (default: the concurrency level)
  --timeout <seconds>              Per-request timeout (default 60)
  --break-time <seconds>           Pause between concurrency levels (default 5)
  --outdir <path>                  Output directory (default load_test_results)
  --help                           Show this help message
)";


int main(int argc, char* argv[]) {
    signal(SIGABRT, [](int) {
        void* trace[64];
        int n = backtrace(trace, 64);
        backtrace_symbols_fd(trace, n, STDERR_FILENO);
        _exit(1);
    });

    std::optional<std::string> config_path = std::nullopt;
    std::optional<std::string> base_url = std::nullopt;
    std::optional<std::string> model = std::nullopt;
    std::optional<std::string> concurrency_levels = std::nullopt;
    std::optional<std::string> repetitions = std::nullopt;
    std::optional<std::string> warmup = std::nullopt;
    std::optional<std::string> requests = std::nullopt;
    std::optional<std::string> timeout_sec = std::nullopt;
    std::optional<std::string> break_time = std::nullopt;
    std::optional<std::string> outdir = std::nullopt;

    std::string arg;
    for (int i = 1; i < argc; ++i) {
        arg = argv[i];
        if (arg == "--help") {
            std::cout << help_text << std::endl;
            return 0;
        } else if (arg == "--base-url" && i + 1 < argc) {
            base_url = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--concurrency-levels" && i + 1 < argc) {
            concurrency_levels = argv[++i];
        } else if (arg == "--repetitions" && i + 1 < argc) {
            repetitions = argv[++i];
        } else if (arg == "--warmup" && i + 1 < argc) {
            warmup = argv[++i];
        } else if (arg == "--requests" && i + 1 < argc) {
            requests = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_sec = argv[++i];
        } else if (arg == "--break-time" && i + 1 < argc) {
            break_time = argv[++i];
        } else if (arg == "--outdir" && i + 1 < argc) {
            outdir = argv[++i];
        } else if (i == 1 && !arg.starts_with("--")) {
            config_path = arg;
        } else {
            std::cerr << "Unrecognized or incomplete argument: " << arg << "\n";
            return 1;
        }
    }

    SweepConfig cfg;
    try {
        if (config_path.has_value()) {
            cfg = load_config(config_path.value());
        } else if (std::filesystem::exists(default_config_path)) {
            cfg = load_config(default_config_path);
        } else {
            Logger.info(std::format("No {} found, using defaults", default_config_path));
        }

        if (base_url.has_value()) cfg.transport.url = base_url.value();
        if (model.has_value()) cfg.transport.model = model.value();
        if (concurrency_levels.has_value()) cfg.concurrency_levels = parse_concurrency_levels(concurrency_levels.value());
        if (repetitions.has_value()) cfg.repetitions = std::stoi(repetitions.value());
        if (warmup.has_value()) cfg.warmup_requests = std::stoi(warmup.value());
        if (requests.has_value()) cfg.requests_per_run = std::stoi(requests.value());
        if (timeout_sec.has_value()) cfg.transport.timeout_s = std::stod(timeout_sec.value());
        if (break_time.has_value()) cfg.break_between_levels_s = std::stod(break_time.value());
        if (outdir.has_value()) cfg.output_dir = outdir.value();

        cfg.validate();
        prepare_output_dir(cfg.output_dir);
    } catch (const std::logic_error& e) {
        // std::stoi / std::stod
        Logger.error(std::format("Invalid numeric argument: {}", e.what()));
        return 1;
    } catch (const std::runtime_error& e) {
        Logger.error(e.what());
        return 1;
    }
    Logger.debug(cfg.to_str());

    try {
        auto timeout_ms = std::chrono::milliseconds(static_cast<long>(cfg.transport.timeout_s * 1000));
        auto shared_client = std::make_shared<CURLHandler>(cfg.transport.url, cfg.transport.resolve_api_key(), timeout_ms);

        RequestExecutor executor(shared_client, cfg.transport.request_defaults());
        ConcurrencyRunner runner(executor, cfg.warmup_requests, cfg.max_retries);
        UuidPromptSource prompt_source(cfg.prompts.base_prompt, cfg.prompts.target_tokens);
        UuidPromptSource warmup_source(cfg.prompts.warmup_prompt, cfg.prompts.target_tokens);
        TrialAggregator aggregator(runner, prompt_source, warmup_source, cfg);
        ScalingSweeper sweeper(*shared_client, aggregator, cfg);

        std::string levels;
        for (auto level: cfg.concurrency_levels) {
            levels += std::format("{} ", level);
        }
        Logger.info(std::format("Testing with concurrency levels: {}", levels));

        auto timestamp = timestamp_now();
        auto result = sweeper.sweep();

        Logger.info(format_summary_table(result));
        write_report(result, cfg, timestamp);
    } catch (const SetupError& e) {
        Logger.error(e.what());
        return 1;
    } catch (const ConfigError& e) {
        Logger.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger.error(std::format("Sweep failed: {}", e.what()));
        return 1;
    }
    return 0;
}
