/**
 * @file scheduling.hpp
 * @brief Execution stages, critical path, timing bounds and bottlenecks.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"

#include <vector>

namespace pipeline_dag {

/// Jobs that may all start once every earlier stage has finished.
using ExecutionStage = std::vector<JobName>;

struct CriticalPath {
    std::vector<JobName> jobs;                   ///< Root-to-sink, in execution order
    Seconds total{0};                            ///< Sum of job weights on the path
};

struct Schedule {
    std::vector<ExecutionStage> stages;
    CriticalPath critical_path;
    Seconds serial_time{0};
    Seconds parallel_time{0};
    std::vector<JobName> bottlenecks;
};

/**
 * @brief Duration-weighted analysis of a dependency graph.
 *
 * Every weighted result is empty on a cyclic graph: the analysis refuses
 * to approximate.
 */
class SchedulingAnalyzer {
public:
    explicit SchedulingAnalyzer(AnalysisConfig config = {});

    /// Estimated duration, or the configured default when absent or zero.
    [[nodiscard]] Seconds weight(const JobMap& jobs, const JobName& name) const;

    [[nodiscard]] std::vector<ExecutionStage> stages(const DependencyGraph& graph) const;
    /**
     * @brief Longest weighted chain, walked back from the node with maximum
     *        dist (ties: first in topological order). Empty on a cycle.
     */
    [[nodiscard]] CriticalPath critical_path(const DependencyGraph& graph,
                                             const JobMap& jobs) const;
    [[nodiscard]] Seconds serial_time(const JobMap& jobs) const;
    [[nodiscard]] Seconds parallel_time(const JobMap& jobs,
                                        const std::vector<ExecutionStage>& stages) const;

    /// Jobs blocking many dependents, or gating the next stage alone.
    [[nodiscard]] std::vector<JobName> bottlenecks(const DependencyGraph& graph,
                                                   const std::vector<ExecutionStage>& stages) const;

    [[nodiscard]] Schedule analyze(const DependencyGraph& graph, const JobMap& jobs) const;

private:
    AnalysisConfig config_;
};

}  // namespace pipeline_dag
