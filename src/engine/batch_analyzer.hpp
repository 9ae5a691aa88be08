/**
 * @file batch_analyzer.hpp
 * @brief Analyze many independent pipelines in parallel.
 *
 * One engine invocation per pipeline, each on its own copy of the input.
 * Invocations share nothing, so the only coordination is collecting the
 * outcomes, which come back in input order.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "engine/dag_analyzer.hpp"
#include "engine/thread_pool.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pipeline_dag {

struct PipelineInput {
    std::string source;                          ///< File path or other label
    JobMap jobs;
};

struct BatchOutcome {
    std::string source;
    std::optional<AnalysisResult> analysis;
    std::optional<OptimizeResult> optimization;  ///< Only when requested
    std::optional<Error> error;                  ///< Contract violation or Timeout

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/**
 * Owns the worker pool. Destruction joins the workers, so it waits for any
 * analysis that outlived its budget in an earlier run().
 */
class BatchAnalyzer {
public:
    explicit BatchAnalyzer(const Config& config, Logger* logger = nullptr);

    /**
     * @brief Run every pipeline on the worker pool.
     *
     * A pipeline that exceeds the per-file budget once started is reported
     * as incomplete (ErrorCode::Timeout) and run() moves on without it. The
     * overrunning analysis keeps its worker until it finishes; its result
     * is discarded. A zero budget waits without limit.
     */
    [[nodiscard]] std::vector<BatchOutcome> run(std::vector<PipelineInput> inputs,
                                                bool with_optimization = false) const;

    [[nodiscard]] std::chrono::milliseconds timeout_per_file() const noexcept;

private:
    Config config_;
    Logger* logger_;
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace pipeline_dag
