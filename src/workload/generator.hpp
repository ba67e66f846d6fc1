/**
 * @file generator.hpp
 * @brief Synthetic subtask topologies for testing and benchmarking.
 */

#pragma once

#include "workload/subtask.hpp"

#include <random>
#include <vector>

namespace workflow_orchestrator {

/**
 * @brief Factory for synthetic subtask batches with various topologies.
 *
 * Every generator returns subtasks in an order where dependencies precede
 * their dependents, except cycle() which by construction has no such order.
 */
class SubtaskGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static std::vector<SubTask> chain(size_t num_tasks,
                                      Complexity complexity = Complexity::Simple);

    /// Fan-out / Fan-in: src → {branch_0 .. branch_{w-1}} → sink
    static std::vector<SubTask> fan_out_fan_in(size_t width,
                                               Complexity complexity = Complexity::Simple);

    /// Diamond: repeated fan-out/fan-in at each depth level
    static std::vector<SubTask> diamond(size_t depth, size_t width,
                                        Complexity complexity = Complexity::Simple);

    /// Random DAG; edges only run from lower to higher index.
    static std::vector<SubTask> random_dag(size_t num_tasks,
                                           float edge_probability,
                                           std::mt19937& rng);

    /// Ring of `length` tasks where each depends on its predecessor and the
    /// first depends on the last.
    static std::vector<SubTask> cycle(size_t length);
};

}  // namespace workflow_orchestrator
