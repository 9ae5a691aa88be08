/**
 * @file issues.hpp
 * @brief Dependency issues and optimization suggestions.
 *
 * Both are closed tagged variants. severity() and describe() give reporting
 * collaborators a stable severity and a one-line message per alternative.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pipeline_dag {

// ─────────────────────────────────────────────
// Dependency Issues
// ─────────────────────────────────────────────

struct CircularDependency {
    std::vector<JobName> cycle;                  ///< Ordered members, closing edge implied

    auto operator<=>(const CircularDependency&) const = default;
};

struct MissingDependency {
    JobName job;
    JobName missing;

    auto operator<=>(const MissingDependency&) const = default;
};

struct RedundantDependency {
    JobName job;
    JobName dependency;                          ///< The direct edge that can go
    std::set<JobName> implied_by;                ///< Direct dependencies that already reach it

    auto operator<=>(const RedundantDependency&) const = default;
};

using DependencyIssue = std::variant<CircularDependency, MissingDependency, RedundantDependency>;

// ─────────────────────────────────────────────
// Optimization Suggestions
// ─────────────────────────────────────────────

struct ParallelizeIndependentJobs {
    JobName job_a;
    JobName job_b;

    auto operator<=>(const ParallelizeIndependentJobs&) const = default;
};

struct SplitBottleneckJob {
    JobName job;
    size_t step_count = 0;

    auto operator<=>(const SplitBottleneckJob&) const = default;
};

struct LongDependencyChain {
    std::vector<JobName> path;

    auto operator<=>(const LongDependencyChain&) const = default;
};

struct LargeJob {
    JobName job;
    size_t step_count = 0;

    auto operator<=>(const LargeJob&) const = default;
};

using OptimizationSuggestion =
    std::variant<ParallelizeIndependentJobs, SplitBottleneckJob, LongDependencyChain, LargeJob>;

// ─────────────────────────────────────────────
// Reporting helpers
// ─────────────────────────────────────────────

[[nodiscard]] std::string_view kind(const DependencyIssue& issue) noexcept;
[[nodiscard]] std::string_view kind(const OptimizationSuggestion& suggestion) noexcept;

[[nodiscard]] Severity severity(const DependencyIssue& issue) noexcept;
[[nodiscard]] Severity severity(const OptimizationSuggestion& suggestion) noexcept;

[[nodiscard]] std::string describe(const DependencyIssue& issue);
[[nodiscard]] std::string describe(const OptimizationSuggestion& suggestion);

/// True when the issue is structural (cycle or missing dependency).
[[nodiscard]] bool is_structural(const DependencyIssue& issue) noexcept;

/// "a -> b -> c"
[[nodiscard]] std::string join_path(const std::vector<JobName>& names,
                                    std::string_view separator = " -> ");

}  // namespace pipeline_dag
