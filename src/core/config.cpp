/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace pipeline_dag {

namespace {

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [analysis]
    if (auto analysis = tbl["analysis"]; analysis.is_table()) {
        config.analysis.default_job_duration_s =
            analysis["default_job_duration_s"].value_or(int64_t{60});
        config.analysis.bottleneck_min_dependents = static_cast<uint32_t>(
            analysis["bottleneck_min_dependents"].value_or(int64_t{3}));
        config.analysis.long_chain_threshold = static_cast<uint32_t>(
            analysis["long_chain_threshold"].value_or(int64_t{4}));
        config.analysis.split_bottleneck_step_threshold = static_cast<uint32_t>(
            analysis["split_bottleneck_step_threshold"].value_or(int64_t{5}));
        config.analysis.large_job_step_threshold = static_cast<uint32_t>(
            analysis["large_job_step_threshold"].value_or(int64_t{10}));
    }

    // [optimization]
    if (auto optimization = tbl["optimization"]; optimization.is_table()) {
        config.optimization.remove_redundant_dependencies =
            optimization["remove_redundant_dependencies"].value_or(true);
        config.optimization.enable_parallelization =
            optimization["enable_parallelization"].value_or(true);
    }

    // [performance]
    if (auto performance = tbl["performance"]; performance.is_table()) {
        config.performance.max_workers = static_cast<uint32_t>(
            performance["max_workers"].value_or(int64_t{4}));
        config.performance.timeout_per_file_ms = static_cast<uint32_t>(
            performance["timeout_per_file_ms"].value_or(int64_t{30000}));
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
    }

    if (config.analysis.default_job_duration_s <= 0) {
        return Error{ErrorCode::InvalidInput,
                     "analysis.default_job_duration_s must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::InvalidInput,
                     "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidInput,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidInput,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace pipeline_dag
