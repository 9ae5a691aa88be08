/**
 * @file redundancy_optimizer.hpp
 * @brief Removes declared dependencies already implied by other ones.
 */

#pragma once

#include "graph/dependency_graph.hpp"
#include "graph/graph_builder.hpp"
#include "optimize/changes.hpp"

#include <vector>

namespace pipeline_dag {

class RedundancyOptimizer {
public:
    /**
     * @brief Drop redundant names from every job's declared needs.
     *
     * Candidates for a job are computed once against its original direct
     * set; each is then confirmed against the set that remains after the
     * removals already accepted. A cyclic graph is returned unchanged.
     */
    [[nodiscard]] OptimizeResult optimize(const BuiltGraph& built) const;

    /**
     * @brief Safety rule shared with the parallelization pass.
     *
     * Walks `candidates` in order and keeps a candidate only if it is still
     * an ancestor of some other dependency in `direct` that has not been
     * removed. Returns the accepted removals.
     */
    [[nodiscard]] static std::vector<JobName> confirm_removals(
        const DependencyGraph& graph,
        const std::vector<JobName>& direct,
        const std::vector<JobName>& candidates);

    /// Copy of `names` without any entry of `removed`, order kept.
    [[nodiscard]] static std::vector<JobName> without(const std::vector<JobName>& names,
                                                      const std::vector<JobName>& removed);
};

}  // namespace pipeline_dag
