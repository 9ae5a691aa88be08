/**
 * @file dag_analyzer.hpp
 * @brief Engine entry point: analyze() and optimize() over one job map.
 *
 * Both calls are pure functions of their input: the caller's map is never
 * modified and nothing is shared between calls, so one DagAnalyzer may be
 * used from many threads at once.
 */

#pragma once

#include "analysis/issues.hpp"
#include "analysis/scheduling.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "optimize/changes.hpp"

#include <vector>

namespace pipeline_dag {

struct AnalysisResult {
    JobMap jobs;                                 ///< With derived duration / parallelizability
    std::vector<Edge> edges;
    std::vector<ExecutionStage> stages;
    CriticalPath critical_path;
    Seconds serial_time{0};
    Seconds parallel_time{0};
    std::vector<JobName> bottlenecks;
    std::vector<DependencyIssue> issues;
    std::vector<OptimizationSuggestion> suggestions;

    [[nodiscard]] bool has_cycle() const noexcept;
    [[nodiscard]] bool has_structural_issues() const noexcept;
};

class DagAnalyzer {
public:
    /// `logger` may be null; it must outlive the analyzer otherwise.
    explicit DagAnalyzer(const Config& config = default_config(), Logger* logger = nullptr);

    /**
     * @brief Full analysis of one pipeline.
     *
     * Jobs without an estimated_duration get one from DurationEstimator;
     * supplied estimates are kept. Fails only on a contract violation.
     */
    [[nodiscard]] Result<AnalysisResult> analyze(const JobMap& jobs) const;

    /**
     * @brief Rewritten needs with redundant and intra-group edges removed.
     *
     * A cyclic pipeline comes back unchanged with an empty change-log.
     */
    [[nodiscard]] Result<OptimizeResult> optimize(const JobMap& jobs) const;

private:
    void log(LogLevel level, std::string_view message) const;

    AnalysisConfig analysis_;
    OptimizationConfig optimization_;
    Logger* logger_;
};

}  // namespace pipeline_dag
