/**
 * @file issues.cpp
 * @brief Kinds, severities and messages for issues and suggestions.
 */

#include "analysis/issues.hpp"

#include <format>

namespace pipeline_dag {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

}  // namespace

std::string join_path(const std::vector<JobName>& names, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += separator;
        out += names[i];
    }
    return out;
}

std::string_view kind(const DependencyIssue& issue) noexcept {
    return std::visit(Overloaded{
        [](const CircularDependency&)  -> std::string_view { return "circular_dependency"; },
        [](const MissingDependency&)   -> std::string_view { return "missing_dependency"; },
        [](const RedundantDependency&) -> std::string_view { return "redundant_dependency"; },
    }, issue);
}

std::string_view kind(const OptimizationSuggestion& suggestion) noexcept {
    return std::visit(Overloaded{
        [](const ParallelizeIndependentJobs&) -> std::string_view {
            return "parallelize_independent_jobs";
        },
        [](const SplitBottleneckJob&)  -> std::string_view { return "split_bottleneck_job"; },
        [](const LongDependencyChain&) -> std::string_view { return "long_dependency_chain"; },
        [](const LargeJob&)            -> std::string_view { return "large_job"; },
    }, suggestion);
}

Severity severity(const DependencyIssue& issue) noexcept {
    return std::holds_alternative<RedundantDependency>(issue) ? Severity::Low : Severity::High;
}

Severity severity(const OptimizationSuggestion& suggestion) noexcept {
    return std::visit(Overloaded{
        [](const ParallelizeIndependentJobs&) { return Severity::Medium; },
        [](const SplitBottleneckJob&)         { return Severity::Medium; },
        [](const LongDependencyChain&)        { return Severity::Low; },
        [](const LargeJob&)                   { return Severity::Low; },
    }, suggestion);
}

bool is_structural(const DependencyIssue& issue) noexcept {
    return !std::holds_alternative<RedundantDependency>(issue);
}

std::string describe(const DependencyIssue& issue) {
    return std::visit(Overloaded{
        [](const CircularDependency& c) {
            auto closed = c.cycle;
            if (!closed.empty()) closed.push_back(closed.front());
            return std::format("Circular dependency detected: {}", join_path(closed));
        },
        [](const MissingDependency& m) {
            return std::format("Job '{}' depends on non-existent job '{}'", m.job, m.missing);
        },
        [](const RedundantDependency& r) {
            std::vector<JobName> witnesses(r.implied_by.begin(), r.implied_by.end());
            return std::format("Job '{}' has redundant dependency on '{}', implied by {}",
                               r.job, r.dependency, join_path(witnesses, ", "));
        },
    }, issue);
}

std::string describe(const OptimizationSuggestion& suggestion) {
    return std::visit(Overloaded{
        [](const ParallelizeIndependentJobs& p) {
            return std::format("Jobs '{}' and '{}' could run in parallel", p.job_a, p.job_b);
        },
        [](const SplitBottleneckJob& s) {
            return std::format("Job '{}' is a bottleneck with {} steps; consider splitting it",
                               s.job, s.step_count);
        },
        [](const LongDependencyChain& l) {
            return std::format("Long dependency chain: {}", join_path(l.path));
        },
        [](const LargeJob& l) {
            return std::format("Job '{}' has {} steps; consider splitting into parallel jobs",
                               l.job, l.step_count);
        },
    }, suggestion);
}

}  // namespace pipeline_dag
