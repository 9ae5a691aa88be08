/**
 * @file duration_estimator.hpp
 * @brief Heuristic duration and parallelizability of a job's steps.
 *
 * Estimates are ranking weights, not predictions.
 */

#pragma once

#include "core/types.hpp"

#include <span>

namespace pipeline_dag {

class DurationEstimator {
public:
    static constexpr Seconds kPerStep{30};
    static constexpr Seconds kSetupOrCacheAction{30};
    static constexpr Seconds kBuildOrTestAction{120};
    static constexpr Seconds kInstallCommand{60};
    static constexpr Seconds kBuildCommand{120};
    static constexpr Seconds kTestCommand{90};

    /// 30 s per step plus the first matching keyword bonus of each step.
    [[nodiscard]] static Seconds estimate(std::span<const Step> steps);

    /// False if any step mentions "deploy" or "release".
    [[nodiscard]] static bool can_parallelize(std::span<const Step> steps);

    /// Derive can_parallelize on every job and estimated_duration where absent.
    static void annotate(JobMap& jobs);

private:
    [[nodiscard]] static Seconds step_bonus(const Step& step);
};

}  // namespace pipeline_dag
