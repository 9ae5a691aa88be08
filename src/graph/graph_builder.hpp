/**
 * @file graph_builder.hpp
 * @brief Needs normalization and dependency graph construction.
 *
 * normalize_needs() is the only place that branches on the shape of a
 * needs declaration; everything downstream sees plain name lists.
 */

#pragma once

#include "analysis/issues.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"

#include <vector>

namespace pipeline_dag {

/**
 * @brief Flatten a needs declaration into a duplicate-free name list.
 *
 * Accepts a single name, a list of names and/or `{job = ...}` entries, or a
 * mapping keyed by name. Fails with ContractViolation on an entry without a
 * `job` field or on an empty name.
 */
[[nodiscard]] Result<std::vector<JobName>> normalize_needs(const NeedsDeclaration& needs);

/**
 * @brief Output of GraphBuilder::build().
 */
struct BuiltGraph {
    DependencyGraph graph;
    DependencyMap declared;                        ///< Normalized needs, dangling names included
    std::vector<DependencyIssue> missing;          ///< One MissingDependency per dangling name
};

class GraphBuilder {
public:
    /// Build the maximal feasible graph from raw job records.
    [[nodiscard]] static Result<BuiltGraph> build(const JobMap& jobs);

    /// Build from already-normalized needs (used on optimizer output).
    [[nodiscard]] static BuiltGraph build(const DependencyMap& declared);
};

}  // namespace pipeline_dag
