/**
 * @file test_analyzer.cpp
 * @brief End-to-end tests of DagAnalyzer on reference pipelines and
 *        randomized property checks on generated ones.
 */

#include "engine/dag_analyzer.hpp"
#include "graph/graph_builder.hpp"
#include "optimize/redundancy_optimizer.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/job_file.hpp"
#include "workload/pipeline_generator.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <filesystem>
#include <map>
#include <random>
#include <set>

using namespace pipeline_dag;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

// ─── Helpers ─────────────────────────────────

static JobMap from_dependencies(const DependencyMap& declared) {
    JobMap jobs;
    for (const auto& [name, needs] : declared) {
        Job job;
        job.name = name;
        NeedsList list;
        for (const auto& dep : needs) list.emplace_back(dep);
        job.needs = std::move(list);
        jobs.emplace(name, std::move(job));
    }
    return jobs;
}

static AnalysisResult analyze(const JobMap& jobs, const Config& config = default_config()) {
    auto result = DagAnalyzer{config}.analyze(jobs);
    EXPECT_TRUE(result.has_value()) << result.error().message;
    return std::move(*result);
}

// ═══════════════════════════════════════════════
// Reference Scenarios
// ═══════════════════════════════════════════════

TEST(AnalyzerIntegration, ScenarioLinearWithShortcut) {
    auto jobs = from_dependencies({{"build", {}}, {"test", {"build"}}, {"deploy", {"build", "test"}}});
    auto result = analyze(jobs);

    ASSERT_EQ(result.stages.size(), 3u);
    EXPECT_THAT(result.stages[0], ElementsAre("build"));
    EXPECT_THAT(result.stages[1], ElementsAre("test"));
    EXPECT_THAT(result.stages[2], ElementsAre("deploy"));
    EXPECT_THAT(result.critical_path.jobs, ElementsAre("build", "test", "deploy"));
    EXPECT_EQ(result.critical_path.total, Seconds{180});
    EXPECT_EQ(result.serial_time, Seconds{180});
    EXPECT_EQ(result.parallel_time, Seconds{180});
    EXPECT_EQ(result.edges.size(), 3u);
}

TEST(AnalyzerIntegration, ScenarioTwoRoots) {
    auto jobs = from_dependencies({{"build", {}}, {"lint", {}},
                                   {"test", {"build"}}, {"package", {"build", "lint"}}});
    jobs["build"].estimated_duration = Seconds{100};
    jobs["lint"].estimated_duration = Seconds{20};
    jobs["test"].estimated_duration = Seconds{90};
    jobs["package"].estimated_duration = Seconds{40};

    auto result = analyze(jobs);
    ASSERT_EQ(result.stages.size(), 2u);
    EXPECT_THAT(result.stages[0], UnorderedElementsAre("build", "lint"));
    EXPECT_THAT(result.stages[1], UnorderedElementsAre("test", "package"));
    EXPECT_EQ(result.parallel_time, Seconds{100 + 90});
    EXPECT_EQ(result.serial_time, Seconds{250});

    bool any_redundant = std::any_of(result.issues.begin(), result.issues.end(),
        [](const DependencyIssue& i) { return std::holds_alternative<RedundantDependency>(i); });
    EXPECT_FALSE(any_redundant);
}

TEST(AnalyzerIntegration, ScenarioRedundantEdge) {
    auto jobs = from_dependencies({{"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}});
    DagAnalyzer analyzer;

    auto result = analyzer.analyze(jobs);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->issues.size(), 1u);
    EXPECT_EQ(std::get<RedundantDependency>(result->issues[0]),
              (RedundantDependency{"c", "a", {"b"}}));

    auto optimized = analyzer.optimize(jobs);
    ASSERT_TRUE(optimized.has_value());
    EXPECT_THAT(optimized->dependencies.at("c"), ElementsAre("b"));

    // Stages and critical path are unaffected by the rewrite.
    auto rewritten = analyzer.analyze(from_dependencies(optimized->dependencies));
    ASSERT_TRUE(rewritten.has_value());
    EXPECT_EQ(rewritten->stages, result->stages);
    EXPECT_EQ(rewritten->critical_path.jobs, result->critical_path.jobs);
    EXPECT_TRUE(rewritten->issues.empty());
}

TEST(AnalyzerIntegration, ScenarioCycle) {
    auto jobs = from_dependencies({{"x", {"y"}}, {"y", {"x"}}});
    auto result = analyze(jobs);

    ASSERT_EQ(result.issues.size(), 1u);
    const auto& cycle = std::get<CircularDependency>(result.issues[0]);
    EXPECT_THAT(cycle.cycle, UnorderedElementsAre("x", "y"));
    EXPECT_TRUE(result.has_cycle());
    EXPECT_TRUE(result.has_structural_issues());
    EXPECT_TRUE(result.stages.empty());
    EXPECT_TRUE(result.critical_path.jobs.empty());
    EXPECT_EQ(result.parallel_time, Seconds{0});
}

TEST(AnalyzerIntegration, CyclicPipelineNotRewritten) {
    auto jobs = from_dependencies({{"x", {"y"}}, {"y", {"x"}}, {"z", {"x", "y"}}});
    auto optimized = DagAnalyzer{}.optimize(jobs);
    ASSERT_TRUE(optimized.has_value());
    EXPECT_TRUE(optimized->changes.empty());
    EXPECT_THAT(optimized->dependencies.at("z"), ElementsAre("x", "y"));
}

TEST(AnalyzerIntegration, DanglingDependencies) {
    auto jobs = from_dependencies({{"build", {}}, {"deploy", {"build", "ghost", "phantom"}}});
    auto result = analyze(jobs);

    EXPECT_EQ(result.issues.size(), 2u);
    EXPECT_TRUE(result.has_structural_issues());
    EXPECT_FALSE(result.has_cycle());
    EXPECT_EQ(result.edges.size(), 1u);
    // Weighted analysis still runs on the feasible graph.
    EXPECT_EQ(result.stages.size(), 2u);
}

TEST(AnalyzerIntegration, ContractViolationRejected) {
    JobMap jobs;
    jobs["build"] = Job{.name = "compile"};
    auto result = DagAnalyzer{}.analyze(jobs);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ContractViolation);
}

TEST(AnalyzerIntegration, InputNotModified) {
    auto jobs = from_dependencies({{"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}});
    auto copy = jobs;
    DagAnalyzer analyzer;
    (void)analyzer.analyze(jobs);
    (void)analyzer.optimize(jobs);
    EXPECT_EQ(jobs, copy);
}

TEST(AnalyzerIntegration, EstimatesDerivedFromSteps) {
    auto jobs = parse_job_file(R"(
        [jobs.build]
        steps = [{ uses = "actions/checkout@v4" }, { run = "npm ci" }, { run = "npm run build" }]

        [jobs.release]
        needs = "build"
        steps = [{ run = "./release.sh" }]

        [jobs.pinned]
        needs = "build"
        steps = [{ run = "make test" }]
    )");
    ASSERT_TRUE(jobs.has_value()) << jobs.error().message;
    (*jobs)["pinned"].estimated_duration = Seconds{500};

    auto result = analyze(*jobs);
    EXPECT_EQ(*result.jobs.at("build").estimated_duration, Seconds{270});
    EXPECT_TRUE(result.jobs.at("build").can_parallelize);
    EXPECT_FALSE(result.jobs.at("release").can_parallelize);
    EXPECT_EQ(*result.jobs.at("pinned").estimated_duration, Seconds{500});
    EXPECT_THAT(result.critical_path.jobs, ElementsAre("build", "pinned"));
}

TEST(AnalyzerIntegration, LongChainAndLargeJobSuggestions) {
    auto jobs = PipelineGenerator::linear_chain(6);
    for (int i = 0; i < 11; ++i) {
        jobs["job_005"].steps.push_back(Step{.run = "echo step"});
    }

    auto result = analyze(jobs);
    std::set<std::string_view> kinds;
    for (const auto& suggestion : result.suggestions) kinds.insert(kind(suggestion));
    EXPECT_TRUE(kinds.contains("long_dependency_chain"));
    EXPECT_TRUE(kinds.contains("large_job"));
}

TEST(AnalyzerIntegration, OptimizationPassesCanBeDisabled) {
    auto config = default_config();
    config.optimization.remove_redundant_dependencies = false;
    auto jobs = from_dependencies({{"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}});

    auto optimized = DagAnalyzer{config}.optimize(jobs);
    ASSERT_TRUE(optimized.has_value());
    EXPECT_TRUE(optimized->changes.empty());
    EXPECT_THAT(optimized->dependencies.at("c"), ElementsAre("a", "b"));
}

TEST(AnalyzerIntegration, FacadeLogsThroughLogger) {
    auto dir = std::filesystem::temp_directory_path() / "pd_test_analyzer_logs";
    std::filesystem::remove_all(dir);
    {
        Logger logger(std::make_unique<JsonFileSink>(dir, "analyzer"), LogLevel::Debug);
        DagAnalyzer analyzer(default_config(), &logger);
        (void)analyzer.analyze(from_dependencies({{"x", {"y"}}, {"y", {"x"}}}));
        logger.flush();
    }
    EXPECT_GT(std::filesystem::file_size(dir / "analyzer.ndjson"), 0u);
    std::filesystem::remove_all(dir);
}

// ═══════════════════════════════════════════════
// Randomized Properties
// ═══════════════════════════════════════════════

class RandomPipelineProperties : public ::testing::TestWithParam<unsigned> {
protected:
    JobMap make_jobs() {
        std::mt19937 rng(GetParam());
        std::uniform_int_distribution<size_t> size(1, 30);
        std::uniform_real_distribution<float> density(0.0f, 0.5f);
        return PipelineGenerator::random_pipeline(size(rng), density(rng), 8, rng);
    }
};

TEST_P(RandomPipelineProperties, StagesPartitionJobsAndRespectEdges) {
    auto jobs = make_jobs();
    auto result = analyze(jobs);

    std::map<JobName, size_t> stage_of;
    for (size_t s = 0; s < result.stages.size(); ++s) {
        for (const auto& name : result.stages[s]) {
            EXPECT_TRUE(stage_of.emplace(name, s).second) << name << " placed twice";
        }
    }
    EXPECT_EQ(stage_of.size(), jobs.size());

    for (const auto& [from, to] : result.edges) {
        EXPECT_LT(stage_of.at(from), stage_of.at(to)) << from << " -> " << to;
    }
}

TEST_P(RandomPipelineProperties, ParallelTimeBoundedBySerialTime) {
    auto result = analyze(make_jobs());
    EXPECT_LE(result.parallel_time, result.serial_time);

    bool all_singletons = std::all_of(result.stages.begin(), result.stages.end(),
                                      [](const ExecutionStage& s) { return s.size() == 1; });
    EXPECT_EQ(result.parallel_time == result.serial_time, all_singletons);
}

TEST_P(RandomPipelineProperties, CriticalPathBounds) {
    auto jobs = make_jobs();
    auto result = analyze(jobs);

    EXPECT_LE(result.critical_path.total, result.serial_time);
    EXPECT_LE(result.critical_path.total, result.parallel_time);
    EXPECT_EQ(result.critical_path.total == result.serial_time,
              result.critical_path.jobs.size() == jobs.size());

    // Consecutive path members are joined by an edge.
    std::set<Edge> edges(result.edges.begin(), result.edges.end());
    for (size_t i = 1; i < result.critical_path.jobs.size(); ++i) {
        EXPECT_TRUE(edges.contains({result.critical_path.jobs[i - 1],
                                    result.critical_path.jobs[i]}));
    }
}

TEST_P(RandomPipelineProperties, OptimizerIdempotentAndReachabilityPreserving) {
    auto jobs = make_jobs();
    DagAnalyzer analyzer;

    auto first = analyzer.optimize(jobs);
    ASSERT_TRUE(first.has_value());
    auto second = analyzer.optimize(from_dependencies(first->dependencies));
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->changes.empty());

    auto before = GraphBuilder::build(jobs);
    ASSERT_TRUE(before.has_value());
    auto after = GraphBuilder::build(first->dependencies);
    for (const auto& name : before->graph.nodes()) {
        EXPECT_EQ(before->graph.descendants(name), after.graph.descendants(name)) << name;
    }

    auto reanalyzed = analyze(from_dependencies(first->dependencies));
    EXPECT_TRUE(std::none_of(reanalyzed.issues.begin(), reanalyzed.issues.end(),
        [](const DependencyIssue& i) { return std::holds_alternative<RedundantDependency>(i); }));
}

INSTANTIATE_TEST_SUITE_P(Seeds, RandomPipelineProperties, ::testing::Range(1u, 41u));
