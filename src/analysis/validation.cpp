/**
 * @file validation.cpp
 * @brief ValidationPass implementation.
 */

#include "analysis/validation.hpp"

#include <iterator>

namespace pipeline_dag {

std::vector<DependencyIssue> ValidationPass::find_cycles(const DependencyGraph& graph) {
    std::vector<DependencyIssue> issues;
    if (!graph.has_cycle()) return issues;

    for (auto& cycle : graph.simple_cycles()) {
        issues.emplace_back(CircularDependency{std::move(cycle)});
    }
    return issues;
}

RedundantSet ValidationPass::redundant_dependencies(const DependencyGraph& graph,
                                                    const JobName& job) {
    RedundantSet redundant;
    const auto& direct = graph.predecessors(job);
    if (direct.size() < 2) return redundant;

    for (const auto& d1 : direct) {
        auto reach = graph.ancestors(d1);
        for (const auto& d2 : direct) {
            if (d2 != d1 && reach.contains(d2)) {
                redundant[d2].insert(d1);
            }
        }
    }
    return redundant;
}

std::vector<DependencyIssue> ValidationPass::find_redundant(const DependencyGraph& graph) {
    std::vector<DependencyIssue> issues;
    for (const auto& job : graph.nodes()) {
        for (auto& [dependency, witnesses] : redundant_dependencies(graph, job)) {
            issues.emplace_back(RedundantDependency{job, dependency, std::move(witnesses)});
        }
    }
    return issues;
}

std::vector<DependencyIssue> ValidationPass::validate(const BuiltGraph& built) {
    auto issues = find_cycles(built.graph);
    issues.insert(issues.end(), built.missing.begin(), built.missing.end());

    auto redundant = find_redundant(built.graph);
    issues.insert(issues.end(),
                  std::make_move_iterator(redundant.begin()),
                  std::make_move_iterator(redundant.end()));
    return issues;
}

}  // namespace pipeline_dag
