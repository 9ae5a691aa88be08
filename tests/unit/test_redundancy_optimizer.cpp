/**
 * @file test_redundancy_optimizer.cpp
 * @brief Unit tests for RedundancyOptimizer.
 */

#include "optimize/redundancy_optimizer.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace pipeline_dag;
using ::testing::ElementsAre;

// ─── Scenarios ───────────────────────────────

TEST(RedundancyOptimizerTest, RemovesImpliedDependency) {
    auto built = GraphBuilder::build(DependencyMap{{"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}});
    auto result = RedundancyOptimizer{}.optimize(built);

    EXPECT_THAT(result.dependencies.at("c"), ElementsAre("b"));
    EXPECT_THAT(result.dependencies.at("b"), ElementsAre("a"));
    ASSERT_EQ(result.changes.size(), 1u);
    EXPECT_EQ(result.changes[0].job, "c");
    EXPECT_THAT(result.changes[0].removed, ElementsAre("a"));
    EXPECT_EQ(result.changes[0].reason, ChangeReason::RemoveRedundantDependency);
    EXPECT_EQ(result.removed_count(), 1u);
}

TEST(RedundancyOptimizerTest, TransitiveReductionOfFullClosure) {
    auto built = GraphBuilder::build(DependencyMap{
        {"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}, {"d", {"a", "b", "c"}}});
    auto result = RedundancyOptimizer{}.optimize(built);

    EXPECT_THAT(result.dependencies.at("c"), ElementsAre("b"));
    EXPECT_THAT(result.dependencies.at("d"), ElementsAre("c"));
    ASSERT_EQ(result.changes.size(), 2u);
    EXPECT_EQ(result.changes[0].job, "c");
    EXPECT_EQ(result.changes[1].job, "d");
    EXPECT_THAT(result.changes[1].removed, ElementsAre("a", "b"));
}

TEST(RedundancyOptimizerTest, Idempotent) {
    auto built = GraphBuilder::build(DependencyMap{
        {"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}, {"d", {"a", "c"}}});
    auto first = RedundancyOptimizer{}.optimize(built);
    ASSERT_FALSE(first.changes.empty());

    auto second = RedundancyOptimizer{}.optimize(GraphBuilder::build(first.dependencies));
    EXPECT_TRUE(second.changes.empty());
    EXPECT_EQ(second.dependencies, first.dependencies);
}

TEST(RedundancyOptimizerTest, PreservesReachability) {
    DependencyMap declared{{"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}, {"d", {"a", "b", "c"}}};
    auto before = GraphBuilder::build(declared);
    auto result = RedundancyOptimizer{}.optimize(before);
    auto after = GraphBuilder::build(result.dependencies);

    for (const auto& name : before.graph.nodes()) {
        EXPECT_EQ(before.graph.descendants(name), after.graph.descendants(name)) << name;
    }
}

TEST(RedundancyOptimizerTest, KeepsDanglingNames) {
    auto built = GraphBuilder::build(DependencyMap{{"a", {}}, {"b", {"a"}}, {"c", {"a", "ghost", "b"}}});
    auto result = RedundancyOptimizer{}.optimize(built);
    EXPECT_THAT(result.dependencies.at("c"), ElementsAre("ghost", "b"));
}

TEST(RedundancyOptimizerTest, NothingToRemove) {
    DependencyMap declared{{"build", {}}, {"lint", {}}, {"package", {"build", "lint"}}};
    auto result = RedundancyOptimizer{}.optimize(GraphBuilder::build(declared));
    EXPECT_TRUE(result.changes.empty());
    EXPECT_EQ(result.dependencies, declared);
}

TEST(RedundancyOptimizerTest, CyclicGraphUnchanged) {
    DependencyMap declared{{"x", {"y"}}, {"y", {"x"}}, {"z", {"x", "y"}}};
    auto result = RedundancyOptimizer{}.optimize(GraphBuilder::build(declared));
    EXPECT_TRUE(result.changes.empty());
    EXPECT_EQ(result.dependencies, declared);
}

// ─── Helpers ─────────────────────────────────

TEST(RedundancyOptimizerTest, ConfirmRemovalsNeedsSurvivingWitness) {
    auto built = GraphBuilder::build(DependencyMap{{"a", {}}, {"b", {"a"}}, {"c", {"a", "b"}}});
    const auto& graph = built.graph;

    EXPECT_THAT(RedundancyOptimizer::confirm_removals(graph, {"a", "b"}, {"a"}), ElementsAre("a"));
    // b is not implied by a, so it stays.
    EXPECT_TRUE(RedundancyOptimizer::confirm_removals(graph, {"a", "b"}, {"b"}).empty());
    EXPECT_TRUE(RedundancyOptimizer::confirm_removals(graph, {"a", "b"}, {}).empty());
}

TEST(RedundancyOptimizerTest, WithoutKeepsOrder) {
    EXPECT_THAT(RedundancyOptimizer::without({"d", "a", "c", "b"}, {"a", "b"}),
                ElementsAre("d", "c"));
    EXPECT_TRUE(RedundancyOptimizer::without({}, {"a"}).empty());
}
