/**
 * @file main.cpp
 * @brief pipeline_dag command-line entry point.
 *
 * Wires the modules into one batch run:
 *   Config → Logger → job files → BatchAnalyzer → ReportCollector
 *
 * Exit status: 0 clean, 1 issues found, 2 fatal error.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/batch_analyzer.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/report_collector.hpp"
#include "workload/job_file.hpp"
#include "workload/pipeline_generator.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace pipeline_dag;

namespace {

constexpr int kExitClean = 0;
constexpr int kExitIssues = 1;
constexpr int kExitFatal = 2;

void print_banner() {
    std::cerr << R"(
  ╔═══════════════════════════════════════════╗
  ║            PipelineDag v1.0.0             ║
  ║   CI Pipeline Dependency Graph Analyzer   ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

void print_usage() {
    std::cout << "Usage: pipeline_dag [OPTIONS] [JOB_FILE...]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --jobs <path>       Job file to analyze (repeatable)\n"
              << "  --optimize          Also report the optimized dependency map\n"
              << "  --log-dir <path>    Log output directory (default: stdout)\n"
              << "  --log-level <lvl>   debug | info | warn | error\n"
              << "  --demo              Analyze generated sample pipelines, then exit\n"
              << "  --help, -h          Show this help message\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_explicit = false;
    std::vector<std::filesystem::path> job_files;
    std::string log_dir;
    std::string log_level;
    bool optimize = false;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_explicit = true;
        } else if (arg == "--jobs" && i + 1 < argc) {
            args.job_files.emplace_back(argv[++i]);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--optimize") {
            args.optimize = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitClean);
        } else if (!arg.starts_with("-")) {
            args.job_files.emplace_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(kExitFatal);
        }
    }
    return args;
}

/**
 * @brief Two generated pipelines: a matrix build and a random one.
 */
std::vector<PipelineInput> demo_inputs() {
    std::vector<Step> steps{
        Step{.name = "checkout", .uses = "actions/checkout@v4"},
        Step{.name = "deps", .run = "npm ci"},
        Step{.name = "build", .run = "npm run build"},
    };

    std::mt19937 rng(42);
    std::vector<PipelineInput> inputs;
    inputs.push_back({"demo:diamond", PipelineGenerator::diamond(2, 3, steps)});
    inputs.push_back({"demo:random", PipelineGenerator::random_pipeline(12, 0.3f, 8, rng)});
    return inputs;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        if (args.config_explicit || config_result.error().code != ErrorCode::NotFound) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return kExitFatal;
        }
        std::cerr << "No config at " << args.config_path.string()
                  << "; using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << config.telemetry.log_level << std::endl;
        return kExitFatal;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "pipeline_dag",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), *level);
    logger.info("PipelineDag starting...");

    ReportCollector report(std::make_unique<StdoutSink>());
    bool fatal = false;

    // ── Collect inputs ───────────────────────
    std::vector<PipelineInput> inputs;
    if (args.demo_mode) {
        logger.info("=== Demo Mode ===");
        inputs = demo_inputs();
    }

    for (const auto& path : args.job_files) {
        auto jobs = load_job_file(path);
        if (!jobs) {
            logger.error(std::format("Cannot load {}: {}", path.string(), jobs.error().message));
            report.record_failure(path.string(), jobs.error());
            fatal = true;
            continue;
        }
        inputs.push_back({path.string(), std::move(*jobs)});
    }

    if (inputs.empty() && !fatal) {
        std::cerr << "No job files given." << std::endl;
        print_usage();
        return kExitFatal;
    }

    // ── Analyze ──────────────────────────────
    logger.info(std::format("Analyzing {} pipeline(s) with {} worker(s)",
                            inputs.size(), config.performance.max_workers));

    BatchAnalyzer batch(config, &logger);
    auto outcomes = batch.run(std::move(inputs), args.optimize);

    bool issues_found = false;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            report.record_failure(outcome.source, *outcome.error);
            fatal = true;
            continue;
        }

        report.record_analysis(outcome.source, *outcome.analysis);
        if (outcome.optimization) {
            report.record_optimization(outcome.source, *outcome.optimization);
        }
        if (!outcome.analysis->issues.empty()) issues_found = true;

        logger.info(std::format("{}: {} jobs, {} stages, critical path {}s, {} issues",
                                outcome.source, outcome.analysis->jobs.size(),
                                outcome.analysis->stages.size(),
                                outcome.analysis->critical_path.total.count(),
                                outcome.analysis->issues.size()));
    }

    report.flush();
    logger.info("PipelineDag finished.");
    logger.flush();

    if (fatal) return kExitFatal;
    return issues_found ? kExitIssues : kExitClean;
}
