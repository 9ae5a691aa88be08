/**
 * @file types.hpp
 * @brief Fundamental types used throughout PipelineDag.
 *
 * Defines JobName, Step, the raw "needs" declaration shapes, and the Job
 * record handed to the engine by the configuration collaborator.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pipeline_dag {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobName = std::string;
using Seconds = std::chrono::seconds;

/// Directed edge: dependency → dependent.
using Edge = std::pair<JobName, JobName>;

// ─────────────────────────────────────────────
// Steps
// ─────────────────────────────────────────────

/**
 * @brief One step of a job.
 *
 * Opaque to the engine except for keyword classification of the action
 * reference and command text.
 */
struct Step {
    std::string name;
    std::string uses;                            ///< Action reference, e.g. "actions/checkout@v4"
    std::string run;                             ///< Command text
    std::map<std::string, std::string> with;     ///< Action parameters

    /// Flat textual form used for keyword scans ("deploy", "release").
    [[nodiscard]] std::string serialize() const;

    auto operator<=>(const Step&) const = default;
};

// ─────────────────────────────────────────────
// Needs Declaration
// ─────────────────────────────────────────────

/**
 * @brief Structured list entry, e.g. `{ job = "build", artifacts = false }`.
 */
struct NeedsEntry {
    std::optional<std::string> job;
    bool artifacts = true;
    bool optional = false;

    auto operator<=>(const NeedsEntry&) const = default;
};

using NeedsItem = std::variant<std::string, NeedsEntry>;
using NeedsList = std::vector<NeedsItem>;

/// Mapping form: keys are dependency names, values are opaque.
using NeedsMap = std::map<std::string, std::string>;

/**
 * @brief Raw dependency declaration in one of the dialect shapes.
 *
 * monostate means the job declares no dependencies.
 */
using NeedsDeclaration = std::variant<std::monostate, std::string, NeedsList, NeedsMap>;

// ─────────────────────────────────────────────
// Job
// ─────────────────────────────────────────────

struct Job {
    JobName name;
    NeedsDeclaration needs;
    std::vector<Step> steps;
    std::string runs_on;                         ///< Pass-through, ignored by the engine

    std::optional<Seconds> estimated_duration;   ///< Derived by DurationEstimator
    bool can_parallelize = true;                 ///< Derived by DurationEstimator

    auto operator<=>(const Job&) const = default;
};

/// Ordered so that every derived structure is deterministic.
using JobMap = std::map<JobName, Job>;

/// Normalized, declared dependency names per job.
using DependencyMap = std::map<JobName, std::vector<JobName>>;

// ─────────────────────────────────────────────
// Severity
// ─────────────────────────────────────────────

enum class Severity : uint8_t {
    Low,
    Medium,
    High
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:    return "low";
        case Severity::Medium: return "medium";
        case Severity::High:   return "high";
    }
    return "unknown";
}

}  // namespace pipeline_dag
