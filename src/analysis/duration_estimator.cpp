/**
 * @file duration_estimator.cpp
 * @brief Keyword classification of steps.
 */

#include "analysis/duration_estimator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace pipeline_dag {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(std::string_view haystack, std::span<const std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

constexpr std::array<std::string_view, 2> kSetupActionKeywords{"setup-", "cache"};
constexpr std::array<std::string_view, 2> kBuildActionKeywords{"build", "test"};
constexpr std::array<std::string_view, 5> kInstallCommands{
    "npm install", "npm ci", "yarn install", "pnpm install", "pip install"};
constexpr std::array<std::string_view, 2> kBuildCommandKeywords{"build", "compile"};
constexpr std::array<std::string_view, 1> kTestCommandKeywords{"test"};
constexpr std::array<std::string_view, 2> kSerialOnlyKeywords{"deploy", "release"};

}  // namespace

Seconds DurationEstimator::step_bonus(const Step& step) {
    // A step with an action reference is classified by it alone.
    if (!step.uses.empty()) {
        auto action = to_lower(step.uses);
        if (contains_any(action, kSetupActionKeywords)) return kSetupOrCacheAction;
        if (contains_any(action, kBuildActionKeywords)) return kBuildOrTestAction;
        return Seconds{0};
    }

    if (!step.run.empty()) {
        auto command = to_lower(step.run);
        if (contains_any(command, kInstallCommands))     return kInstallCommand;
        if (contains_any(command, kBuildCommandKeywords)) return kBuildCommand;
        if (contains_any(command, kTestCommandKeywords))  return kTestCommand;
    }

    return Seconds{0};
}

Seconds DurationEstimator::estimate(std::span<const Step> steps) {
    Seconds total = kPerStep * static_cast<int64_t>(steps.size());
    for (const auto& step : steps) {
        total += step_bonus(step);
    }
    return total;
}

bool DurationEstimator::can_parallelize(std::span<const Step> steps) {
    return std::none_of(steps.begin(), steps.end(), [](const Step& step) {
        return contains_any(to_lower(step.serialize()), kSerialOnlyKeywords);
    });
}

void DurationEstimator::annotate(JobMap& jobs) {
    for (auto& [_, job] : jobs) {
        if (!job.estimated_duration) {
            job.estimated_duration = estimate(job.steps);
        }
        job.can_parallelize = can_parallelize(job.steps);
    }
}

}  // namespace pipeline_dag
