/**
 * @file parallelization_advisor.hpp
 * @brief Finds jobs that could run side by side and proposes rewrites.
 *
 * Two passes flag candidate groups: jobs of one execution stage that do not
 * feed each other, and jobs declaring exactly the same needs. Groups are
 * deduplicated by job set.
 */

#pragma once

#include "analysis/issues.hpp"
#include "analysis/scheduling.hpp"
#include "core/config.hpp"
#include "graph/graph_builder.hpp"
#include "optimize/changes.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace pipeline_dag {

enum class GroupOrigin : uint8_t {
    SameStage,
    IdenticalNeeds
};

[[nodiscard]] constexpr std::string_view to_string(GroupOrigin origin) noexcept {
    switch (origin) {
        case GroupOrigin::SameStage:      return "same_stage";
        case GroupOrigin::IdenticalNeeds: return "identical_needs";
    }
    return "unknown";
}

struct ParallelGroup {
    std::vector<JobName> jobs;                   ///< Node order
    GroupOrigin origin = GroupOrigin::SameStage;
};

class ParallelizationAdvisor {
public:
    explicit ParallelizationAdvisor(AnalysisConfig config = {});

    [[nodiscard]] std::vector<ParallelGroup> parallel_groups(
        const BuiltGraph& built, const std::vector<ExecutionStage>& stages) const;

    /// One suggestion per unordered same-stage pair with no shared descendant.
    [[nodiscard]] std::vector<OptimizationSuggestion> independent_pairs(
        const DependencyGraph& graph, const std::vector<ExecutionStage>& stages) const;

    /// The longest hop-count chain, if it has more jobs than the threshold.
    [[nodiscard]] std::optional<LongDependencyChain> long_chain(const DependencyGraph& graph) const;

    [[nodiscard]] std::vector<OptimizationSuggestion> split_bottlenecks(
        const JobMap& jobs, const std::vector<JobName>& bottlenecks) const;

    [[nodiscard]] std::vector<OptimizationSuggestion> large_jobs(const JobMap& jobs) const;

    /// Every advisory suggestion, in a stable order.
    [[nodiscard]] std::vector<OptimizationSuggestion> suggest(const BuiltGraph& built,
                                                              const JobMap& jobs,
                                                              const Schedule& schedule) const;

    /**
     * @brief Remove dependencies between members of a flagged group.
     *
     * Only intra-group edges are considered, and each removal must pass the
     * RedundancyOptimizer safety rule. A cyclic graph is returned unchanged.
     */
    [[nodiscard]] OptimizeResult enable_parallelization(
        const BuiltGraph& built, const std::vector<ExecutionStage>& stages) const;

private:
    [[nodiscard]] static std::vector<JobName> independent_members(const DependencyGraph& graph,
                                                                  const ExecutionStage& stage);

    AnalysisConfig config_;
};

}  // namespace pipeline_dag
