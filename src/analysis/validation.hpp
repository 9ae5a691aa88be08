/**
 * @file validation.hpp
 * @brief Structural and redundancy checks on a built dependency graph.
 */

#pragma once

#include "analysis/issues.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/graph_builder.hpp"

#include <map>
#include <set>
#include <vector>

namespace pipeline_dag {

/// Redundant direct dependency → the direct dependencies that imply it.
using RedundantSet = std::map<JobName, std::set<JobName>>;

class ValidationPass {
public:
    /// One CircularDependency per simple cycle; empty on an acyclic graph.
    [[nodiscard]] static std::vector<DependencyIssue> find_cycles(const DependencyGraph& graph);

    /**
     * @brief Redundant direct dependencies of one job.
     *
     * d2 is redundant when it is an ancestor of another direct dependency
     * d1; every such d1 is collected as a witness. Jobs with fewer than two
     * direct dependencies have none.
     */
    [[nodiscard]] static RedundantSet redundant_dependencies(const DependencyGraph& graph,
                                                             const JobName& job);

    [[nodiscard]] static std::vector<DependencyIssue> find_redundant(const DependencyGraph& graph);

    /// Cycles, then the builder's missing dependencies, then redundancy.
    [[nodiscard]] static std::vector<DependencyIssue> validate(const BuiltGraph& built);
};

}  // namespace pipeline_dag
