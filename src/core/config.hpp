/**
 * @file config.hpp
 * @brief Analyzer configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace pipeline_dag {

struct AnalysisConfig {
    int64_t default_job_duration_s = 60;          ///< Weight for jobs without an estimate
    uint32_t bottleneck_min_dependents = 3;       ///< Out-degree that marks a bottleneck
    uint32_t long_chain_threshold = 4;            ///< Chains with more jobs than this are reported
    uint32_t split_bottleneck_step_threshold = 5;
    uint32_t large_job_step_threshold = 10;
};

struct OptimizationConfig {
    bool remove_redundant_dependencies = true;
    bool enable_parallelization = true;
};

struct PerformanceConfig {
    uint32_t max_workers = 4;                     ///< 0 = hardware_concurrency
    uint32_t timeout_per_file_ms = 30000;         ///< 0 = no limit
};

struct TelemetryConfig {
    std::filesystem::path log_dir;                ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    AnalysisConfig analysis;
    OptimizationConfig optimization;
    PerformanceConfig performance;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace pipeline_dag
