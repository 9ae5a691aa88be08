/**
 * @file job_file.hpp
 * @brief Load a job map from a TOML job file.
 *
 * Layout:
 *
 *   [jobs.test]
 *   runs_on = "ubuntu-latest"
 *   needs = ["build", { job = "lint", artifacts = false }]
 *   steps = [{ uses = "actions/checkout@v4" }, { run = "make test" }]
 *
 * `needs` may also be a single string or a table keyed by job name.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>

namespace pipeline_dag {

[[nodiscard]] Result<JobMap> load_job_file(const std::filesystem::path& path);

[[nodiscard]] Result<JobMap> parse_job_file(std::string_view toml_text);

}  // namespace pipeline_dag
