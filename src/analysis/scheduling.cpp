/**
 * @file scheduling.cpp
 * @brief SchedulingAnalyzer implementation.
 *
 * The critical path is a longest-path DP over a topological order:
 * dist[n] is the heaviest chain finishing right before n starts, so the
 * chain ending at n weighs dist[n] + weight(n).
 */

#include "analysis/scheduling.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace pipeline_dag {

SchedulingAnalyzer::SchedulingAnalyzer(AnalysisConfig config)
    : config_(config) {}

Seconds SchedulingAnalyzer::weight(const JobMap& jobs, const JobName& name) const {
    Seconds fallback{config_.default_job_duration_s};
    auto it = jobs.find(name);
    if (it == jobs.end() || !it->second.estimated_duration) return fallback;

    auto estimate = *it->second.estimated_duration;
    return estimate > Seconds{0} ? estimate : fallback;
}

// ─────────────────────────────────────────────
// Stages
// ─────────────────────────────────────────────

std::vector<ExecutionStage> SchedulingAnalyzer::stages(const DependencyGraph& graph) const {
    return graph.generations();
}

// ─────────────────────────────────────────────
// Critical Path
// ─────────────────────────────────────────────

CriticalPath SchedulingAnalyzer::critical_path(const DependencyGraph& graph,
                                               const JobMap& jobs) const {
    CriticalPath result;
    if (graph.node_count() == 0) return result;

    auto topo = graph.topological_order();
    if (topo.size() != graph.node_count()) return result;

    std::unordered_map<JobName, Seconds> dist;
    std::unordered_map<JobName, JobName> pred;
    for (const auto& name : topo) {
        dist[name] = Seconds{0};
    }

    for (const auto& u : topo) {
        auto finish = dist[u] + weight(jobs, u);
        for (const auto& v : graph.successors(u)) {
            if (finish > dist[v]) {
                dist[v] = finish;
                pred[v] = u;
            }
        }
    }

    // Walk back from the node with the largest dist; strict comparison keeps
    // the first node in topological order on ties.
    JobName end = topo.front();
    for (const auto& name : topo) {
        if (dist[name] > dist[end]) end = name;
    }

    result.jobs.push_back(end);
    for (auto it = pred.find(end); it != pred.end(); it = pred.find(it->second)) {
        result.jobs.push_back(it->second);
    }
    std::reverse(result.jobs.begin(), result.jobs.end());

    for (const auto& name : result.jobs) {
        result.total += weight(jobs, name);
    }
    return result;
}

// ─────────────────────────────────────────────
// Timing Bounds
// ─────────────────────────────────────────────

Seconds SchedulingAnalyzer::serial_time(const JobMap& jobs) const {
    Seconds total{0};
    for (const auto& [name, _] : jobs) {
        total += weight(jobs, name);
    }
    return total;
}

Seconds SchedulingAnalyzer::parallel_time(const JobMap& jobs,
                                          const std::vector<ExecutionStage>& stages) const {
    Seconds total{0};
    for (const auto& stage : stages) {
        Seconds longest{0};
        for (const auto& name : stage) {
            longest = std::max(longest, weight(jobs, name));
        }
        total += longest;
    }
    return total;
}

// ─────────────────────────────────────────────
// Bottlenecks
// ─────────────────────────────────────────────

std::vector<JobName> SchedulingAnalyzer::bottlenecks(
    const DependencyGraph& graph,
    const std::vector<ExecutionStage>& stages) const {
    std::vector<JobName> result;
    std::unordered_set<JobName> seen;

    for (const auto& name : graph.nodes()) {
        if (graph.out_degree(name) >= config_.bottleneck_min_dependents) {
            result.push_back(name);
            seen.insert(name);
        }
    }

    for (const auto& stage : stages) {
        if (stage.size() != 1) continue;
        const auto& name = stage.front();
        if (graph.out_degree(name) > 0 && seen.insert(name).second) {
            result.push_back(name);
        }
    }

    return result;
}

Schedule SchedulingAnalyzer::analyze(const DependencyGraph& graph, const JobMap& jobs) const {
    Schedule schedule;
    schedule.stages = stages(graph);
    schedule.critical_path = critical_path(graph, jobs);
    schedule.serial_time = serial_time(jobs);
    schedule.parallel_time = parallel_time(jobs, schedule.stages);
    schedule.bottlenecks = bottlenecks(graph, schedule.stages);
    return schedule;
}

}  // namespace pipeline_dag
