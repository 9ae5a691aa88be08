/**
 * @file parallelization_advisor.cpp
 * @brief ParallelizationAdvisor implementation.
 */

#include "optimize/parallelization_advisor.hpp"
#include "optimize/redundancy_optimizer.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace pipeline_dag {

namespace {

bool same_members(const std::vector<JobName>& a, const std::vector<JobName>& b) {
    return std::set<JobName>(a.begin(), a.end()) == std::set<JobName>(b.begin(), b.end());
}

bool has_intra_group_edge(const DependencyGraph& graph, const std::vector<JobName>& group) {
    for (const auto& from : group) {
        for (const auto& to : group) {
            if (from != to && graph.has_edge(from, to)) return true;
        }
    }
    return false;
}

}  // namespace

ParallelizationAdvisor::ParallelizationAdvisor(AnalysisConfig config)
    : config_(config) {}

std::vector<JobName> ParallelizationAdvisor::independent_members(const DependencyGraph& graph,
                                                                 const ExecutionStage& stage) {
    std::vector<JobName> independent;
    for (const auto& job : stage) {
        bool fed_by_stage = std::any_of(stage.begin(), stage.end(), [&](const JobName& other) {
            return other != job && graph.has_edge(other, job);
        });
        if (!fed_by_stage) independent.push_back(job);
    }
    return independent;
}

// ─────────────────────────────────────────────
// Group Detection
// ─────────────────────────────────────────────

std::vector<ParallelGroup> ParallelizationAdvisor::parallel_groups(
    const BuiltGraph& built, const std::vector<ExecutionStage>& stages) const {
    std::vector<ParallelGroup> groups;

    auto add_group = [&groups](std::vector<JobName> jobs, GroupOrigin origin) {
        bool duplicate = std::any_of(groups.begin(), groups.end(), [&](const ParallelGroup& g) {
            return same_members(g.jobs, jobs);
        });
        if (!duplicate) groups.push_back(ParallelGroup{std::move(jobs), origin});
    };

    // (a) same-stage independence
    for (const auto& stage : stages) {
        auto independent = independent_members(built.graph, stage);
        if (independent.size() >= 2) {
            add_group(std::move(independent), GroupOrigin::SameStage);
        }
    }

    // (b) identical normalized needs, regardless of stage
    std::map<std::set<JobName>, std::vector<JobName>> by_needs;
    for (const auto& job : built.graph.nodes()) {
        auto it = built.declared.find(job);
        std::set<JobName> needs;
        if (it != built.declared.end()) needs.insert(it->second.begin(), it->second.end());
        by_needs[needs].push_back(job);
    }
    for (auto& [_, jobs] : by_needs) {
        if (jobs.size() >= 2) {
            add_group(std::move(jobs), GroupOrigin::IdenticalNeeds);
        }
    }

    return groups;
}

// ─────────────────────────────────────────────
// Suggestions
// ─────────────────────────────────────────────

std::vector<OptimizationSuggestion> ParallelizationAdvisor::independent_pairs(
    const DependencyGraph& graph, const std::vector<ExecutionStage>& stages) const {
    std::vector<OptimizationSuggestion> suggestions;

    for (const auto& stage : stages) {
        auto independent = independent_members(graph, stage);
        if (independent.size() < 2) continue;

        std::map<JobName, std::set<JobName>> descendants;
        for (const auto& job : independent) {
            descendants.emplace(job, graph.descendants(job));
        }

        for (size_t i = 0; i < independent.size(); ++i) {
            for (size_t j = i + 1; j < independent.size(); ++j) {
                const auto& a = descendants.at(independent[i]);
                const auto& b = descendants.at(independent[j]);
                bool shared = std::any_of(a.begin(), a.end(),
                                          [&b](const JobName& name) { return b.contains(name); });
                if (shared) continue;

                auto [first, second] = std::minmax(independent[i], independent[j]);
                suggestions.emplace_back(ParallelizeIndependentJobs{first, second});
            }
        }
    }

    return suggestions;
}

std::optional<LongDependencyChain> ParallelizationAdvisor::long_chain(
    const DependencyGraph& graph) const {
    auto chain = graph.longest_chain();
    if (chain.size() <= config_.long_chain_threshold) return std::nullopt;
    return LongDependencyChain{std::move(chain)};
}

std::vector<OptimizationSuggestion> ParallelizationAdvisor::split_bottlenecks(
    const JobMap& jobs, const std::vector<JobName>& bottlenecks) const {
    std::vector<OptimizationSuggestion> suggestions;
    for (const auto& name : bottlenecks) {
        auto it = jobs.find(name);
        if (it == jobs.end()) continue;
        auto steps = it->second.steps.size();
        if (steps > config_.split_bottleneck_step_threshold) {
            suggestions.emplace_back(SplitBottleneckJob{name, steps});
        }
    }
    return suggestions;
}

std::vector<OptimizationSuggestion> ParallelizationAdvisor::large_jobs(const JobMap& jobs) const {
    std::vector<OptimizationSuggestion> suggestions;
    for (const auto& [name, job] : jobs) {
        if (job.steps.size() > config_.large_job_step_threshold) {
            suggestions.emplace_back(LargeJob{name, job.steps.size()});
        }
    }
    return suggestions;
}

std::vector<OptimizationSuggestion> ParallelizationAdvisor::suggest(const BuiltGraph& built,
                                                                    const JobMap& jobs,
                                                                    const Schedule& schedule) const {
    auto suggestions = independent_pairs(built.graph, schedule.stages);

    auto splits = split_bottlenecks(jobs, schedule.bottlenecks);
    suggestions.insert(suggestions.end(), splits.begin(), splits.end());

    if (auto chain = long_chain(built.graph)) {
        suggestions.emplace_back(std::move(*chain));
    }

    auto large = large_jobs(jobs);
    suggestions.insert(suggestions.end(), large.begin(), large.end());
    return suggestions;
}

// ─────────────────────────────────────────────
// Rewrite
// ─────────────────────────────────────────────

OptimizeResult ParallelizationAdvisor::enable_parallelization(
    const BuiltGraph& built, const std::vector<ExecutionStage>& stages) const {
    OptimizeResult result;
    result.dependencies = built.declared;

    const auto& graph = built.graph;
    if (graph.has_cycle()) return result;

    for (const auto& group : parallel_groups(built, stages)) {
        if (!has_intra_group_edge(graph, group.jobs)) continue;

        for (const auto& job : group.jobs) {
            auto& needs = result.dependencies[job];

            std::vector<JobName> remaining;
            for (const auto& dep : graph.predecessors(job)) {
                if (std::find(needs.begin(), needs.end(), dep) != needs.end()) {
                    remaining.push_back(dep);
                }
            }

            std::vector<JobName> candidates;
            for (const auto& dep : remaining) {
                if (dep != job && std::find(group.jobs.begin(), group.jobs.end(), dep)
                                      != group.jobs.end()) {
                    candidates.push_back(dep);
                }
            }
            if (candidates.empty()) continue;

            auto removed = RedundancyOptimizer::confirm_removals(graph, remaining, candidates);
            if (removed.empty()) continue;

            needs = RedundancyOptimizer::without(needs, removed);
            result.changes.push_back(DependencyChange{
                .job = job,
                .removed = std::move(removed),
                .reason = ChangeReason::EnableParallelization
            });
        }
    }

    return result;
}

}  // namespace pipeline_dag
