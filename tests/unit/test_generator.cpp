/**
 * @file test_generator.cpp
 * @brief Unit tests for SubtaskGenerator topologies.
 */

#include "workload/dependency_mapper.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <set>

using namespace workflow_orchestrator;

// ─── Linear Chain ────────────────────────────

TEST(GeneratorTest, ChainTaskCount) {
    EXPECT_EQ(SubtaskGenerator::chain(5).size(), 5u);
    EXPECT_TRUE(SubtaskGenerator::chain(0).empty());
}

TEST(GeneratorTest, ChainDependencies) {
    auto tasks = SubtaskGenerator::chain(4);

    EXPECT_TRUE(tasks[0].dependencies.empty());
    for (size_t i = 1; i < tasks.size(); ++i) {
        ASSERT_EQ(tasks[i].dependencies.size(), 1u);
        EXPECT_EQ(tasks[i].dependencies[0], "chain_" + std::to_string(i - 1));
    }
}

TEST(GeneratorTest, ChainComplexityApplied) {
    for (const auto& t : SubtaskGenerator::chain(3, Complexity::Complex)) {
        EXPECT_EQ(t.complexity, Complexity::Complex);
    }
}

// ─── Fan-out / Fan-in ────────────────────────

TEST(GeneratorTest, FanOutFanInShape) {
    auto tasks = SubtaskGenerator::fan_out_fan_in(4);
    ASSERT_EQ(tasks.size(), 6u);

    EXPECT_EQ(tasks.front().id, "fan_src");
    EXPECT_EQ(tasks.back().id, "fan_sink");
    EXPECT_EQ(tasks.back().dependencies.size(), 4u);
    for (size_t i = 1; i <= 4; ++i) {
        EXPECT_EQ(tasks[i].dependencies, std::vector<TaskId>{"fan_src"});
    }
}

// ─── Diamond ─────────────────────────────────

TEST(GeneratorTest, DiamondTaskCount) {
    // Per level: hub + width branches + merge
    EXPECT_EQ(SubtaskGenerator::diamond(3, 2).size(), 3u * (2 + 2));
}

TEST(GeneratorTest, DiamondLevelsChainThroughMerge) {
    auto tasks = SubtaskGenerator::diamond(2, 3);
    auto hub_1 = std::find_if(tasks.begin(), tasks.end(),
                              [](const SubTask& t) { return t.id == "hub_1"; });
    ASSERT_NE(hub_1, tasks.end());
    EXPECT_EQ(hub_1->dependencies, std::vector<TaskId>{"merge_0"});

    DependencyMapper mapper;
    auto graph = mapper.build_graph(tasks);
    ASSERT_TRUE(graph.is_valid());
    EXPECT_EQ(graph.parallel_groups.size(), 6u);
}

// ─── Random DAG ──────────────────────────────

TEST(GeneratorTest, RandomDagIsAcyclic) {
    std::mt19937 rng(123);
    DependencyMapper mapper;
    for (int i = 0; i < 10; ++i) {
        auto tasks = SubtaskGenerator::random_dag(30, 0.2f, rng);
        EXPECT_EQ(tasks.size(), 30u);
        EXPECT_TRUE(mapper.build_graph(tasks).is_valid());
    }
}

TEST(GeneratorTest, RandomDagIsDeterministicForSeed) {
    std::mt19937 a(99), b(99);
    auto first = SubtaskGenerator::random_dag(20, 0.3f, a);
    auto second = SubtaskGenerator::random_dag(20, 0.3f, b);
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].dependencies, second[i].dependencies);
        EXPECT_EQ(first[i].complexity, second[i].complexity);
    }
}

TEST(GeneratorTest, RandomDagZeroProbabilityHasNoEdges) {
    std::mt19937 rng(1);
    for (const auto& t : SubtaskGenerator::random_dag(10, 0.0f, rng)) {
        EXPECT_TRUE(t.dependencies.empty());
    }
}

// ─── Cycle ───────────────────────────────────

TEST(GeneratorTest, CycleClosesOnFirstTask) {
    auto tasks = SubtaskGenerator::cycle(3);
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[0].dependencies, std::vector<TaskId>{"cycle_2"});
    EXPECT_EQ(tasks[1].dependencies, std::vector<TaskId>{"cycle_0"});
}

TEST(GeneratorTest, IdsAreUnique) {
    std::mt19937 rng(5);
    for (const auto& batch : {SubtaskGenerator::chain(10), SubtaskGenerator::fan_out_fan_in(6),
                              SubtaskGenerator::diamond(3, 3),
                              SubtaskGenerator::random_dag(25, 0.1f, rng)}) {
        std::set<TaskId> ids;
        for (const auto& t : batch) ids.insert(t.id);
        EXPECT_EQ(ids.size(), batch.size());
    }
}
