/**
 * @file test_dependency_mapper.cpp
 * @brief Unit tests for DependencyMapper graph construction.
 */

#include "workload/dependency_mapper.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <unordered_map>

using namespace workflow_orchestrator;

namespace {

SubTask node(std::string id, std::vector<TaskId> deps = {}) {
    SubTask t;
    t.id = std::move(id);
    t.description = "Task " + t.id;
    t.dependencies = std::move(deps);
    return t;
}

std::vector<SubTask> diamond_batch() {
    return {node("t1"), node("t2", {"t1"}), node("t3", {"t1"}), node("t4", {"t2", "t3"})};
}

std::unordered_map<TaskId, size_t> positions(const std::vector<TaskId>& order) {
    std::unordered_map<TaskId, size_t> pos;
    for (size_t i = 0; i < order.size(); ++i) pos[order[i]] = i;
    return pos;
}

}  // namespace

class DependencyMapperTest : public ::testing::Test {
protected:
    DependencyMapper mapper_;
};

// ─── Construction ────────────────────────────

TEST_F(DependencyMapperTest, DiamondGroupsByDepth) {
    auto graph = mapper_.build_graph(diamond_batch());

    EXPECT_FALSE(graph.has_cycles);
    EXPECT_TRUE(graph.is_valid());
    EXPECT_EQ(graph.task_count(), 4u);

    std::vector<std::vector<TaskId>> expected = {{"t1"}, {"t2", "t3"}, {"t4"}};
    EXPECT_EQ(graph.parallel_groups, expected);
    EXPECT_EQ(graph.execution_order, (std::vector<TaskId>{"t1", "t2", "t3", "t4"}));
}

TEST_F(DependencyMapperTest, AdjacencyAndInDegree) {
    auto graph = mapper_.build_graph(diamond_batch());

    EXPECT_EQ(graph.dependents("t1"), (std::vector<TaskId>{"t2", "t3"}));
    EXPECT_TRUE(graph.dependents("t4").empty());
    EXPECT_EQ(graph.in_degree_of("t1"), 0u);
    EXPECT_EQ(graph.in_degree_of("t4"), 2u);
    EXPECT_EQ(graph.depth_of("t4"), std::optional<size_t>{2});
    EXPECT_FALSE(graph.depth_of("missing").has_value());
}

TEST_F(DependencyMapperTest, DuplicateDependencyCountsOnce) {
    auto graph = mapper_.build_graph({node("a"), node("b", {"a", "a"})});
    ASSERT_TRUE(graph.is_valid());
    EXPECT_EQ(graph.in_degree_of("b"), 1u);
    EXPECT_EQ(graph.dependents("a").size(), 1u);
}

TEST_F(DependencyMapperTest, EmptyBatch) {
    auto graph = mapper_.build_graph({});
    EXPECT_TRUE(graph.is_valid());
    EXPECT_TRUE(graph.execution_order.empty());
    EXPECT_TRUE(graph.parallel_groups.empty());
}

TEST_F(DependencyMapperTest, IndependentTasksShareOneGroup) {
    auto graph = mapper_.build_graph({node("x"), node("y"), node("z")});
    ASSERT_EQ(graph.parallel_groups.size(), 1u);
    EXPECT_EQ(graph.parallel_groups[0], (std::vector<TaskId>{"x", "y", "z"}));
}

TEST_F(DependencyMapperTest, DepthIsLongestPathFromRoot) {
    // c depends on a directly and through b; it must land after b
    auto graph = mapper_.build_graph({node("a"), node("b", {"a"}), node("c", {"a", "b"})});
    ASSERT_TRUE(graph.is_valid());
    EXPECT_EQ(graph.depth_of("c"), std::optional<size_t>{2});
    EXPECT_EQ(graph.parallel_groups.size(), 3u);
}

TEST_F(DependencyMapperTest, BuildIsIdempotent) {
    auto first = mapper_.build_graph(diamond_batch());
    auto second = mapper_.build_graph(diamond_batch());
    EXPECT_TRUE(first == second);
}

// ─── Cycles ──────────────────────────────────

TEST_F(DependencyMapperTest, ThreeNodeCycleIsRejected) {
    auto graph = mapper_.build_graph({node("t1", {"t3"}), node("t2", {"t1"}), node("t3", {"t2"})});

    EXPECT_TRUE(graph.has_cycles);
    EXPECT_FALSE(graph.is_valid());
    EXPECT_TRUE(graph.execution_order.empty());
    EXPECT_TRUE(graph.parallel_groups.empty());
    ASSERT_TRUE(graph.error.has_value());
    EXPECT_EQ(graph.error->code, ErrorCode::CyclicDependency);
    EXPECT_EQ(graph.error->message, "Circular dependency detected: t1 -> t2 -> t3 -> t1");
}

TEST_F(DependencyMapperTest, SelfDependencyIsCycle) {
    auto graph = mapper_.build_graph({node("solo", {"solo"})});
    EXPECT_TRUE(graph.has_cycles);
    EXPECT_TRUE(graph.execution_order.empty());
}

TEST_F(DependencyMapperTest, GeneratedRingIsCycle) {
    auto graph = mapper_.build_graph(SubtaskGenerator::cycle(6));
    EXPECT_TRUE(graph.has_cycles);
    EXPECT_TRUE(graph.parallel_groups.empty());
}

TEST_F(DependencyMapperTest, CycleBehindAcyclicPrefix) {
    auto graph = mapper_.build_graph(
        {node("root"), node("a", {"root", "c"}), node("b", {"a"}), node("c", {"b"})});
    EXPECT_TRUE(graph.has_cycles);
    ASSERT_TRUE(graph.error.has_value());
    EXPECT_NE(graph.error->message.find("a -> b -> c -> a"), std::string::npos);
}

// ─── Validation ──────────────────────────────

TEST_F(DependencyMapperTest, ValidateRejectsDuplicateIds) {
    auto result = DependencyMapper::validate({node("a"), node("a")});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::DuplicateTaskId);
}

TEST_F(DependencyMapperTest, ValidateRejectsUnknownReference) {
    auto result = DependencyMapper::validate({node("a"), node("b", {"ghost"})});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnknownTaskReference);
    EXPECT_EQ(result.error().message, "Subtask b depends on unknown task ghost");
}

TEST_F(DependencyMapperTest, InvalidBatchYieldsNoOrdering) {
    auto graph = mapper_.build_graph({node("a"), node("b", {"ghost"})});
    EXPECT_FALSE(graph.has_cycles);
    EXPECT_FALSE(graph.is_valid());
    EXPECT_TRUE(graph.execution_order.empty());
    EXPECT_TRUE(graph.nodes.empty());
}

// ─── Ready Tasks ─────────────────────────────

TEST_F(DependencyMapperTest, ReadyTasksFollowCompletion) {
    auto batch = diamond_batch();

    EXPECT_EQ(DependencyMapper::ready_tasks({}, batch), std::vector<TaskId>{"t1"});
    EXPECT_EQ(DependencyMapper::ready_tasks({"t1"}, batch), (std::vector<TaskId>{"t2", "t3"}));
    EXPECT_EQ(DependencyMapper::ready_tasks({"t1", "t2"}, batch), std::vector<TaskId>{"t3"});
    EXPECT_EQ(DependencyMapper::ready_tasks({"t1", "t2", "t3"}, batch), std::vector<TaskId>{"t4"});
    EXPECT_TRUE(DependencyMapper::ready_tasks({"t1", "t2", "t3", "t4"}, batch).empty());
}

// ─── Generated Topologies ────────────────────

TEST_F(DependencyMapperTest, FanOutFanInHasThreeLevels) {
    auto graph = mapper_.build_graph(SubtaskGenerator::fan_out_fan_in(4));
    ASSERT_TRUE(graph.is_valid());
    ASSERT_EQ(graph.parallel_groups.size(), 3u);
    EXPECT_EQ(graph.parallel_groups[1].size(), 4u);
    EXPECT_EQ(graph.parallel_groups[2], std::vector<TaskId>{"fan_sink"});
}

TEST_F(DependencyMapperTest, RandomDagOrderRespectsEveryEdge) {
    std::mt19937 rng(42);
    for (int round = 0; round < 20; ++round) {
        auto batch = SubtaskGenerator::random_dag(40, 0.15f, rng);
        auto graph = mapper_.build_graph(batch);
        ASSERT_TRUE(graph.is_valid());
        ASSERT_EQ(graph.execution_order.size(), batch.size());

        auto pos = positions(graph.execution_order);
        for (const auto& task : batch) {
            for (const auto& dep : task.dependencies) {
                EXPECT_LT(pos.at(dep), pos.at(task.id));
                EXPECT_LT(*graph.depth_of(dep), *graph.depth_of(task.id));
            }
        }

        size_t grouped = 0;
        for (const auto& group : graph.parallel_groups) grouped += group.size();
        EXPECT_EQ(grouped, batch.size());
    }
}
