/**
 * @file changes.hpp
 * @brief Rewritten dependency map and change-log returned by optimizers.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pipeline_dag {

enum class ChangeReason : uint8_t {
    RemoveRedundantDependency,
    EnableParallelization
};

[[nodiscard]] constexpr std::string_view to_string(ChangeReason reason) noexcept {
    switch (reason) {
        case ChangeReason::RemoveRedundantDependency: return "remove_redundant_dependency";
        case ChangeReason::EnableParallelization:     return "enable_parallelization";
    }
    return "unknown";
}

struct DependencyChange {
    JobName job;
    std::vector<JobName> removed;
    ChangeReason reason = ChangeReason::RemoveRedundantDependency;

    auto operator<=>(const DependencyChange&) const = default;
};

/**
 * @brief A new dependency map plus the ordered log of what changed.
 *
 * Never aliases the caller's input.
 */
struct OptimizeResult {
    DependencyMap dependencies;
    std::vector<DependencyChange> changes;

    [[nodiscard]] size_t removed_count() const noexcept {
        size_t total = 0;
        for (const auto& change : changes) total += change.removed.size();
        return total;
    }
};

}  // namespace pipeline_dag
