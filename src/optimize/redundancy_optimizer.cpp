/**
 * @file redundancy_optimizer.cpp
 * @brief RedundancyOptimizer implementation.
 */

#include "optimize/redundancy_optimizer.hpp"
#include "analysis/validation.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace pipeline_dag {

std::vector<JobName> RedundancyOptimizer::confirm_removals(
    const DependencyGraph& graph,
    const std::vector<JobName>& direct,
    const std::vector<JobName>& candidates) {
    std::vector<JobName> removed;
    std::map<JobName, std::set<JobName>> ancestor_cache;

    auto ancestors_of = [&](const JobName& name) -> const std::set<JobName>& {
        auto it = ancestor_cache.find(name);
        if (it == ancestor_cache.end()) {
            it = ancestor_cache.emplace(name, graph.ancestors(name)).first;
        }
        return it->second;
    };

    auto is_removed = [&](const JobName& name) {
        return std::find(removed.begin(), removed.end(), name) != removed.end();
    };

    for (const auto& candidate : candidates) {
        if (is_removed(candidate)) continue;

        bool still_implied = std::any_of(direct.begin(), direct.end(), [&](const JobName& other) {
            return other != candidate && !is_removed(other)
                && ancestors_of(other).contains(candidate);
        });

        if (still_implied) {
            removed.push_back(candidate);
        }
    }

    return removed;
}

std::vector<JobName> RedundancyOptimizer::without(const std::vector<JobName>& names,
                                                  const std::vector<JobName>& removed) {
    std::vector<JobName> kept;
    kept.reserve(names.size());
    for (const auto& name : names) {
        if (std::find(removed.begin(), removed.end(), name) == removed.end()) {
            kept.push_back(name);
        }
    }
    return kept;
}

OptimizeResult RedundancyOptimizer::optimize(const BuiltGraph& built) const {
    OptimizeResult result;
    result.dependencies = built.declared;

    const auto& graph = built.graph;
    if (graph.has_cycle()) return result;

    for (const auto& job : graph.nodes()) {
        auto redundant = ValidationPass::redundant_dependencies(graph, job);
        if (redundant.empty()) continue;

        std::vector<JobName> candidates;
        candidates.reserve(redundant.size());
        for (const auto& [dependency, _] : redundant) {
            candidates.push_back(dependency);
        }

        auto removed = confirm_removals(graph, graph.predecessors(job), candidates);
        if (removed.empty()) continue;

        auto& needs = result.dependencies[job];
        needs = without(needs, removed);
        result.changes.push_back(DependencyChange{
            .job = job,
            .removed = std::move(removed),
            .reason = ChangeReason::RemoveRedundantDependency
        });
    }

    return result;
}

}  // namespace pipeline_dag
