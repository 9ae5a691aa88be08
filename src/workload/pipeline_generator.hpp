/**
 * @file pipeline_generator.hpp
 * @brief Synthetic pipeline generators for testing and benchmarking.
 */

#pragma once

#include "core/types.hpp"

#include <random>
#include <vector>

namespace pipeline_dag {

/**
 * @brief Factory for synthetic job maps with various topologies.
 *
 * Every generated job carries a copy of the supplied steps, and its needs
 * are a plain list of names.
 */
class PipelineGenerator {
public:
    /// Linear chain: job_0 → job_1 → ... → job_{n-1}
    static JobMap linear_chain(size_t num_jobs, const std::vector<Step>& steps = {});

    /// Fan-out / Fan-in: setup → {shard_0, shard_1, ...} → report
    static JobMap fan_out_fan_in(size_t width, const std::vector<Step>& steps = {});

    /// Diamond: repeated fan-out/fan-in, each level's merge feeding the next hub
    static JobMap diamond(size_t depth, size_t width, const std::vector<Step>& steps = {});

    /// Random acyclic pipeline with configurable edge probability and step counts
    static JobMap random_pipeline(size_t num_jobs,
                                  float edge_probability,
                                  size_t max_steps,
                                  std::mt19937& rng);
};

}  // namespace pipeline_dag
