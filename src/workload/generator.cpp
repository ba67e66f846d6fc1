/**
 * @file generator.cpp
 * @brief Synthetic subtask generator: all topology implementations.
 *
 * Generates batches that model common workflow shapes:
 * - Linear chains (strictly sequential phases)
 * - Fan-out/fan-in (independent work merged at the end)
 * - Diamond (repeated fan-out/fan-in)
 * - Random DAGs (for stress testing and benchmarking)
 * - Cycles (for error-path tests)
 */

#include "workload/generator.hpp"

#include <string>

namespace workflow_orchestrator {

namespace {

SubTask make_task(std::string id, std::string description, Complexity complexity,
                  std::vector<TaskId> dependencies = {}) {
    return SubTask{
        .id = std::move(id),
        .description = std::move(description),
        .parent_id = std::nullopt,
        .dependencies = std::move(dependencies),
        .domain = "general",
        .complexity = complexity,
        .status = TaskStatus::Pending
    };
}

}  // namespace

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

std::vector<SubTask> SubtaskGenerator::chain(size_t num_tasks, Complexity complexity) {
    std::vector<SubTask> tasks;
    tasks.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        auto id = "chain_" + std::to_string(i);
        std::vector<TaskId> deps;
        if (i > 0) deps.push_back(tasks.back().id);
        tasks.push_back(make_task(id, "Chain task " + std::to_string(i), complexity, std::move(deps)));
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          src
//       /   |   \   (backslash)
//     b_0  b_1  b_2  ... b_{width-1}
//       \   |   /
//          sink
// ─────────────────────────────────────────────

std::vector<SubTask> SubtaskGenerator::fan_out_fan_in(size_t width, Complexity complexity) {
    std::vector<SubTask> tasks;
    tasks.reserve(width + 2);

    tasks.push_back(make_task("fan_src", "Fan-out source", complexity));

    std::vector<TaskId> branch_ids;
    for (size_t i = 0; i < width; ++i) {
        auto branch_id = "fan_branch_" + std::to_string(i);
        tasks.push_back(make_task(branch_id, "Branch " + std::to_string(i), complexity, {"fan_src"}));
        branch_ids.push_back(branch_id);
    }

    tasks.push_back(make_task("fan_sink", "Fan-in sink", complexity, std::move(branch_ids)));
    return tasks;
}

// ─────────────────────────────────────────────
// Diamond: Repeated fan-out/fan-in at each depth level.
//
//   hub_0 → {diamond_0_*} → merge_0 → hub_1 → {diamond_1_*} → merge_1 ...
// ─────────────────────────────────────────────

std::vector<SubTask> SubtaskGenerator::diamond(size_t depth, size_t width, Complexity complexity) {
    std::vector<SubTask> tasks;
    TaskId prev_merge;

    for (size_t d = 0; d < depth; ++d) {
        auto hub_id = "hub_" + std::to_string(d);
        std::vector<TaskId> hub_deps;
        if (d > 0) hub_deps.push_back(prev_merge);
        tasks.push_back(make_task(hub_id, "Hub " + std::to_string(d), complexity, std::move(hub_deps)));

        std::vector<TaskId> branch_ids;
        for (size_t w = 0; w < width; ++w) {
            auto branch_id = "diamond_" + std::to_string(d) + "_" + std::to_string(w);
            tasks.push_back(make_task(branch_id,
                                      "Diamond D" + std::to_string(d) + " B" + std::to_string(w),
                                      complexity, {hub_id}));
            branch_ids.push_back(branch_id);
        }

        auto merge_id = "merge_" + std::to_string(d);
        tasks.push_back(make_task(merge_id, "Merge " + std::to_string(d), complexity,
                                  std::move(branch_ids)));
        prev_merge = merge_id;
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Random DAG:
// Erdős–Rényi-style edges, only from lower-indexed to higher-indexed tasks
// to guarantee acyclicity. Complexity is drawn uniformly.
// ─────────────────────────────────────────────

std::vector<SubTask> SubtaskGenerator::random_dag(size_t num_tasks,
                                                  float edge_probability,
                                                  std::mt19937& rng) {
    std::uniform_int_distribution<int> complexity_dist(0, 2);
    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);

    std::vector<SubTask> tasks;
    tasks.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        auto complexity = static_cast<Complexity>(complexity_dist(rng));
        tasks.push_back(make_task("rand_" + std::to_string(i),
                                  "Random task " + std::to_string(i), complexity));
    }

    for (size_t j = 1; j < num_tasks; ++j) {
        for (size_t i = 0; i < j; ++i) {
            if (edge_dist(rng) < edge_probability) {
                tasks[j].dependencies.push_back(tasks[i].id);
            }
        }
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Cycle: c_0 → c_1 → ... → c_{n-1} → c_0
// ─────────────────────────────────────────────

std::vector<SubTask> SubtaskGenerator::cycle(size_t length) {
    std::vector<SubTask> tasks;
    tasks.reserve(length);

    for (size_t i = 0; i < length; ++i) {
        auto prev = "cycle_" + std::to_string((i + length - 1) % length);
        tasks.push_back(make_task("cycle_" + std::to_string(i),
                                  "Cycle task " + std::to_string(i),
                                  Complexity::Simple, {prev}));
    }
    return tasks;
}

}  // namespace workflow_orchestrator
