/**
 * @file pipeline_generator.cpp
 * @brief Synthetic pipeline generator, all topology implementations.
 *
 * Generates job maps that model common CI layouts:
 * - Linear chains (build, test, package, deploy)
 * - Fan-out/fan-in (sharded test suites)
 * - Diamond (multi-stage matrix builds)
 * - Random pipelines (for stress testing and benchmarking)
 */

#include "workload/pipeline_generator.hpp"

#include <array>
#include <format>
#include <string_view>

namespace pipeline_dag {

namespace {

Job make_job(JobName name, std::vector<JobName> needs, const std::vector<Step>& steps) {
    Job job;
    job.name = std::move(name);
    job.steps = steps;
    job.runs_on = "ubuntu-latest";

    if (!needs.empty()) {
        NeedsList list;
        list.reserve(needs.size());
        for (auto& dep : needs) list.emplace_back(std::move(dep));
        job.needs = std::move(list);
    }
    return job;
}

void add(JobMap& jobs, Job job) {
    auto name = job.name;
    jobs.emplace(std::move(name), std::move(job));
}

}  // namespace

// ─────────────────────────────────────────────
// Linear Chain: job_0 → job_1 → ... → job_{n-1}
// ─────────────────────────────────────────────

JobMap PipelineGenerator::linear_chain(size_t num_jobs, const std::vector<Step>& steps) {
    JobMap jobs;

    for (size_t i = 0; i < num_jobs; ++i) {
        std::vector<JobName> needs;
        if (i > 0) needs.push_back(std::format("job_{:03}", i - 1));
        add(jobs, make_job(std::format("job_{:03}", i), std::move(needs), steps));
    }

    return jobs;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//           setup
//       /     |     \    (backslash)
//   shard_0 shard_1 ... shard_{width-1}
//       \     |     /
//           report
// ─────────────────────────────────────────────

JobMap PipelineGenerator::fan_out_fan_in(size_t width, const std::vector<Step>& steps) {
    JobMap jobs;
    add(jobs, make_job("setup", {}, steps));

    std::vector<JobName> shard_names;
    for (size_t i = 0; i < width; ++i) {
        auto shard = std::format("shard_{:03}", i);
        add(jobs, make_job(shard, {"setup"}, steps));
        shard_names.push_back(std::move(shard));
    }

    add(jobs, make_job("report", std::move(shard_names), steps));
    return jobs;
}

// ─────────────────────────────────────────────
// Diamond: one fan-out/fan-in per depth level.
//
//   hub_0 → {matrix_0_0 .. matrix_0_w} → merge_0
//   merge_0 → hub_1 → {matrix_1_0 ..} → merge_1 ...
// ─────────────────────────────────────────────

JobMap PipelineGenerator::diamond(size_t depth, size_t width, const std::vector<Step>& steps) {
    JobMap jobs;
    JobName prev_merge;

    for (size_t d = 0; d < depth; ++d) {
        auto hub = std::format("hub_{}", d);
        std::vector<JobName> hub_needs;
        if (d > 0) hub_needs.push_back(prev_merge);
        add(jobs, make_job(hub, std::move(hub_needs), steps));

        std::vector<JobName> branches;
        for (size_t w = 0; w < width; ++w) {
            auto branch = std::format("matrix_{}_{}", d, w);
            add(jobs, make_job(branch, {hub}, steps));
            branches.push_back(std::move(branch));
        }

        auto merge = std::format("merge_{}", d);
        add(jobs, make_job(merge, std::move(branches), steps));
        prev_merge = merge;
    }

    return jobs;
}

// ─────────────────────────────────────────────
// Random Pipeline:
// Erdős–Rényi-style edges from lower-indexed to higher-indexed jobs only,
// which keeps the result acyclic. Steps are drawn from a small catalog of
// typical CI commands.
// ─────────────────────────────────────────────

JobMap PipelineGenerator::random_pipeline(size_t num_jobs,
                                          float edge_probability,
                                          size_t max_steps,
                                          std::mt19937& rng) {
    static constexpr std::array<std::string_view, 6> kUses{
        "actions/checkout@v4", "actions/setup-node@v4", "actions/cache@v4",
        "docker/build-push-action@v5", "codecov/codecov-action@v4", "actions/upload-artifact@v4"};
    static constexpr std::array<std::string_view, 6> kRuns{
        "npm ci", "make build", "make test", "pip install -r requirements.txt",
        "echo done", "./scripts/lint.sh"};

    std::uniform_int_distribution<size_t> step_count(0, max_steps);
    std::uniform_int_distribution<size_t> catalog(0, kUses.size() - 1);
    std::bernoulli_distribution use_action(0.5);
    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);

    std::vector<JobName> names;
    names.reserve(num_jobs);
    for (size_t i = 0; i < num_jobs; ++i) {
        names.push_back(std::format("job_{:03}", i));
    }

    JobMap jobs;
    for (size_t j = 0; j < num_jobs; ++j) {
        std::vector<JobName> needs;
        for (size_t i = 0; i < j; ++i) {
            if (edge_dist(rng) < edge_probability) {
                needs.push_back(names[i]);
            }
        }

        std::vector<Step> steps;
        size_t count = step_count(rng);
        for (size_t s = 0; s < count; ++s) {
            Step step;
            step.name = std::format("step {}", s);
            if (use_action(rng)) {
                step.uses = std::string{kUses[catalog(rng)]};
            } else {
                step.run = std::string{kRuns[catalog(rng)]};
            }
            steps.push_back(std::move(step));
        }

        add(jobs, make_job(names[j], std::move(needs), steps));
    }

    return jobs;
}

}  // namespace pipeline_dag
