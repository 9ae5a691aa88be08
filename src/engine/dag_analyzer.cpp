/**
 * @file dag_analyzer.cpp
 * @brief Wires builder, validation, scheduling and optimizers together.
 *
 *   JobMap → GraphBuilder → ValidationPass → SchedulingAnalyzer
 *          → RedundancyOptimizer / ParallelizationAdvisor → result values
 */

#include "engine/dag_analyzer.hpp"
#include "analysis/duration_estimator.hpp"
#include "analysis/validation.hpp"
#include "graph/graph_builder.hpp"
#include "optimize/parallelization_advisor.hpp"
#include "optimize/redundancy_optimizer.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace pipeline_dag {

bool AnalysisResult::has_cycle() const noexcept {
    return std::any_of(issues.begin(), issues.end(), [](const DependencyIssue& issue) {
        return std::holds_alternative<CircularDependency>(issue);
    });
}

bool AnalysisResult::has_structural_issues() const noexcept {
    return std::any_of(issues.begin(), issues.end(), [](const DependencyIssue& issue) {
        return is_structural(issue);
    });
}

DagAnalyzer::DagAnalyzer(const Config& config, Logger* logger)
    : analysis_(config.analysis)
    , optimization_(config.optimization)
    , logger_(logger) {}

void DagAnalyzer::log(LogLevel level, std::string_view message) const {
    if (logger_ != nullptr) logger_->log(level, message);
}

Result<AnalysisResult> DagAnalyzer::analyze(const JobMap& jobs) const {
    auto built = GraphBuilder::build(jobs);
    if (!built) {
        log(LogLevel::Error, "Rejected job map: " + built.error().message);
        return built.error();
    }

    AnalysisResult result;
    result.jobs = jobs;
    DurationEstimator::annotate(result.jobs);

    const auto& graph = built->graph;
    result.edges = graph.edges();
    result.issues = ValidationPass::validate(*built);

    SchedulingAnalyzer scheduler(analysis_);
    auto schedule = scheduler.analyze(graph, result.jobs);

    ParallelizationAdvisor advisor(analysis_);
    result.suggestions = advisor.suggest(*built, result.jobs, schedule);

    result.stages = std::move(schedule.stages);
    result.critical_path = std::move(schedule.critical_path);
    result.serial_time = schedule.serial_time;
    result.parallel_time = schedule.parallel_time;
    result.bottlenecks = std::move(schedule.bottlenecks);

    if (result.has_cycle()) {
        log(LogLevel::Warn, "Dependency cycle found; stages and critical path withheld");
    }
    log(LogLevel::Debug, std::format(
        "Analyzed {} jobs, {} edges: {} stages, critical path {}s, serial {}s, parallel {}s, "
        "{} issues, {} suggestions",
        result.jobs.size(), result.edges.size(), result.stages.size(),
        result.critical_path.total.count(), result.serial_time.count(),
        result.parallel_time.count(), result.issues.size(), result.suggestions.size()));

    return result;
}

Result<OptimizeResult> DagAnalyzer::optimize(const JobMap& jobs) const {
    auto built = GraphBuilder::build(jobs);
    if (!built) {
        log(LogLevel::Error, "Rejected job map: " + built.error().message);
        return built.error();
    }

    OptimizeResult result;
    result.dependencies = built->declared;

    if (built->graph.has_cycle()) {
        log(LogLevel::Warn, "Dependency cycle found; dependencies left unchanged");
        return result;
    }

    if (optimization_.remove_redundant_dependencies) {
        RedundancyOptimizer optimizer;
        result = optimizer.optimize(*built);
    }

    if (optimization_.enable_parallelization) {
        auto rebuilt = GraphBuilder::build(result.dependencies);
        ParallelizationAdvisor advisor(analysis_);
        auto parallel = advisor.enable_parallelization(rebuilt, rebuilt.graph.generations());

        result.dependencies = std::move(parallel.dependencies);
        result.changes.insert(result.changes.end(),
                              std::make_move_iterator(parallel.changes.begin()),
                              std::make_move_iterator(parallel.changes.end()));
    }

    log(LogLevel::Debug, std::format("Optimized {} jobs: {} changes, {} dependencies removed",
                                     result.dependencies.size(), result.changes.size(),
                                     result.removed_count()));
    return result;
}

}  // namespace pipeline_dag
