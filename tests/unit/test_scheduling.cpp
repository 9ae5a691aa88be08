/**
 * @file test_scheduling.cpp
 * @brief Unit tests for SchedulingAnalyzer.
 */

#include "analysis/scheduling.hpp"
#include "graph/graph_builder.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace pipeline_dag;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

// ─── Helper ──────────────────────────────────

struct Pipeline {
    JobMap jobs;
    BuiltGraph built;
};

/// Each entry: name, needs, estimated duration in seconds (0 = absent).
static Pipeline make_pipeline(
    const std::vector<std::tuple<std::string, std::vector<std::string>, int64_t>>& rows) {
    Pipeline p;
    DependencyMap declared;
    for (const auto& [name, needs, seconds] : rows) {
        Job job;
        job.name = name;
        if (seconds > 0) job.estimated_duration = Seconds{seconds};
        p.jobs.emplace(name, std::move(job));
        declared.emplace(name, needs);
    }
    p.built = GraphBuilder::build(declared);
    return p;
}

// ─── Weights ─────────────────────────────────

TEST(SchedulingTest, WeightFallsBackToDefault) {
    JobMap jobs;
    jobs["a"] = Job{.name = "a"};
    jobs["b"] = Job{.name = "b", .estimated_duration = Seconds{0}};
    jobs["c"] = Job{.name = "c", .estimated_duration = Seconds{15}};

    SchedulingAnalyzer analyzer;
    EXPECT_EQ(analyzer.weight(jobs, "a"), Seconds{60});
    EXPECT_EQ(analyzer.weight(jobs, "b"), Seconds{60});
    EXPECT_EQ(analyzer.weight(jobs, "c"), Seconds{15});
    EXPECT_EQ(analyzer.weight(jobs, "unknown"), Seconds{60});
}

TEST(SchedulingTest, ConfiguredDefaultWeight) {
    AnalysisConfig config;
    config.default_job_duration_s = 10;
    SchedulingAnalyzer analyzer(config);

    JobMap jobs;
    jobs["a"] = Job{.name = "a"};
    EXPECT_EQ(analyzer.weight(jobs, "a"), Seconds{10});
}

// ─── Stages ──────────────────────────────────

TEST(SchedulingTest, LinearStages) {
    auto p = make_pipeline({{"build", {}, 0}, {"test", {"build"}, 0}, {"deploy", {"build", "test"}, 0}});
    auto stages = SchedulingAnalyzer{}.stages(p.built.graph);

    ASSERT_EQ(stages.size(), 3u);
    EXPECT_THAT(stages[0], ElementsAre("build"));
    EXPECT_THAT(stages[1], ElementsAre("test"));
    EXPECT_THAT(stages[2], ElementsAre("deploy"));
}

TEST(SchedulingTest, ParallelStages) {
    auto p = make_pipeline({{"build", {}, 0}, {"lint", {}, 0},
                            {"test", {"build"}, 0}, {"package", {"build", "lint"}, 0}});
    auto stages = SchedulingAnalyzer{}.stages(p.built.graph);

    ASSERT_EQ(stages.size(), 2u);
    EXPECT_THAT(stages[0], UnorderedElementsAre("build", "lint"));
    EXPECT_THAT(stages[1], UnorderedElementsAre("test", "package"));
}

// ─── Critical Path ───────────────────────────

TEST(SchedulingTest, CriticalPathFollowsHeaviestChain) {
    auto p = make_pipeline({
        {"checkout", {}, 10},
        {"unit", {"checkout"}, 30},
        {"e2e", {"checkout"}, 300},
        {"report", {"unit", "e2e"}, 5},
    });

    auto path = SchedulingAnalyzer{}.critical_path(p.built.graph, p.jobs);
    EXPECT_THAT(path.jobs, ElementsAre("checkout", "e2e", "report"));
    EXPECT_EQ(path.total, Seconds{315});
}

TEST(SchedulingTest, CriticalPathEndsAtMaximumDist) {
    // c is heavier than the whole a -> b chain but has no predecessors.
    auto p = make_pipeline({
        {"a", {}, 60},
        {"b", {"a"}, 10},
        {"c", {}, 200},
    });

    auto path = SchedulingAnalyzer{}.critical_path(p.built.graph, p.jobs);
    EXPECT_THAT(path.jobs, ElementsAre("a", "b"));
    EXPECT_EQ(path.total, Seconds{70});
}

TEST(SchedulingTest, CriticalPathTieGoesToFirstInTopologicalOrder) {
    auto p = make_pipeline({
        {"a", {}, 60},
        {"b", {"a"}, 60},
        {"c", {}, 60},
        {"d", {"c"}, 60},
    });

    auto path = SchedulingAnalyzer{}.critical_path(p.built.graph, p.jobs);
    EXPECT_THAT(path.jobs, ElementsAre("a", "b"));
    EXPECT_EQ(path.total, Seconds{120});
}

TEST(SchedulingTest, CriticalPathSingleJobWhenNoEdges) {
    auto p = make_pipeline({{"lint", {}, 30}, {"build", {}, 300}});

    auto path = SchedulingAnalyzer{}.critical_path(p.built.graph, p.jobs);
    EXPECT_THAT(path.jobs, ElementsAre("build"));
    EXPECT_EQ(path.total, Seconds{300});
}

TEST(SchedulingTest, CriticalPathEmptyOnCycleOrEmptyGraph) {
    auto cyclic = make_pipeline({{"x", {"y"}, 0}, {"y", {"x"}, 0}});
    EXPECT_TRUE(SchedulingAnalyzer{}.critical_path(cyclic.built.graph, cyclic.jobs).jobs.empty());

    auto empty = make_pipeline({});
    auto path = SchedulingAnalyzer{}.critical_path(empty.built.graph, empty.jobs);
    EXPECT_TRUE(path.jobs.empty());
    EXPECT_EQ(path.total, Seconds{0});
}

// ─── Timing Bounds ───────────────────────────

TEST(SchedulingTest, SerialAndParallelTime) {
    auto p = make_pipeline({{"build", {}, 100}, {"lint", {}, 20},
                            {"test", {"build"}, 90}, {"package", {"build", "lint"}, 40}});
    SchedulingAnalyzer analyzer;
    auto stages = analyzer.stages(p.built.graph);

    EXPECT_EQ(analyzer.serial_time(p.jobs), Seconds{250});
    EXPECT_EQ(analyzer.parallel_time(p.jobs, stages), Seconds{190});
}

TEST(SchedulingTest, ParallelTimeZeroWithoutStages) {
    JobMap jobs;
    jobs["x"] = Job{.name = "x"};
    EXPECT_EQ(SchedulingAnalyzer{}.parallel_time(jobs, {}), Seconds{0});
    EXPECT_EQ(SchedulingAnalyzer{}.serial_time(jobs), Seconds{60});
}

// ─── Bottlenecks ─────────────────────────────

TEST(SchedulingTest, HighFanOutIsBottleneck) {
    auto p = make_pipeline({{"setup", {}, 0}, {"other", {}, 0},
                            {"a", {"setup"}, 0}, {"b", {"setup"}, 0}, {"c", {"setup"}, 0}});
    SchedulingAnalyzer analyzer;
    auto stages = analyzer.stages(p.built.graph);
    EXPECT_THAT(analyzer.bottlenecks(p.built.graph, stages), ElementsAre("setup"));
}

TEST(SchedulingTest, SingletonStageWithDependentsIsBottleneck) {
    auto p = make_pipeline({{"build", {}, 0}, {"test", {"build"}, 0}, {"deploy", {"build", "test"}, 0}});
    SchedulingAnalyzer analyzer;
    auto stages = analyzer.stages(p.built.graph);
    EXPECT_THAT(analyzer.bottlenecks(p.built.graph, stages), ElementsAre("build", "test"));
}

TEST(SchedulingTest, BottleneckReportedOnce) {
    auto p = make_pipeline({{"root", {}, 0}, {"a", {"root"}, 0}, {"b", {"root"}, 0},
                            {"c", {"root"}, 0}});
    SchedulingAnalyzer analyzer;
    auto stages = analyzer.stages(p.built.graph);
    EXPECT_THAT(analyzer.bottlenecks(p.built.graph, stages), ElementsAre("root"));
}

TEST(SchedulingTest, AnalyzeCombinesResults) {
    auto p = make_pipeline({{"build", {}, 0}, {"test", {"build"}, 0}, {"deploy", {"build", "test"}, 0}});
    auto schedule = SchedulingAnalyzer{}.analyze(p.built.graph, p.jobs);

    EXPECT_EQ(schedule.stages.size(), 3u);
    EXPECT_THAT(schedule.critical_path.jobs, ElementsAre("build", "test", "deploy"));
    EXPECT_EQ(schedule.critical_path.total, Seconds{180});
    EXPECT_EQ(schedule.serial_time, Seconds{180});
    EXPECT_EQ(schedule.parallel_time, Seconds{180});
}
