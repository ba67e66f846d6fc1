/**
 * @file dependency_mapper.hpp
 * @brief Dependency graph construction over a batch of subtasks.
 *
 * Builds the adjacency list and in-degree table from each subtask's
 * dependency set, rejects cycles, and derives a topological order plus
 * depth-level parallel groups.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/subtask.hpp"

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace workflow_orchestrator {

/**
 * @brief Derived, recomputable DAG over one decomposition batch.
 *
 * Invariant: when `has_cycles` is true (or `error` is set),
 * `execution_order` and `parallel_groups` are empty.
 */
struct DependencyGraph {
    std::vector<TaskId> nodes;                                      ///< Insertion order
    std::unordered_map<TaskId, std::vector<TaskId>> adjacency;      ///< id -> dependents
    std::unordered_map<TaskId, size_t> in_degree;
    bool has_cycles = false;
    std::vector<TaskId> execution_order;
    std::vector<std::vector<TaskId>> parallel_groups;
    std::unordered_map<TaskId, size_t> depths;
    std::optional<Error> error;

    [[nodiscard]] bool is_valid() const noexcept { return !has_cycles && !error.has_value(); }
    [[nodiscard]] size_t task_count() const noexcept { return nodes.size(); }
    [[nodiscard]] const std::vector<TaskId>& dependents(const TaskId& id) const;
    [[nodiscard]] size_t in_degree_of(const TaskId& id) const;
    [[nodiscard]] std::optional<size_t> depth_of(const TaskId& id) const;

    bool operator==(const DependencyGraph&) const = default;
};

/**
 * @brief Builds DependencyGraph instances. Stateless; safe to reuse.
 */
class DependencyMapper {
public:
    /// Reject duplicate ids and dependencies on ids outside the batch.
    [[nodiscard]] static Result<void> validate(const std::vector<SubTask>& subtasks);

    /// Validate, then build. A failed validation or a cycle is reported via
    /// `error`/`has_cycles`; no partial ordering is ever returned.
    [[nodiscard]] DependencyGraph build_graph(const std::vector<SubTask>& subtasks) const;

    /// Ids not in `completed` whose dependencies are all in `completed`, in input order.
    [[nodiscard]] static std::vector<TaskId> ready_tasks(
        const std::unordered_set<TaskId>& completed,
        const std::vector<SubTask>& subtasks);

private:
    /// Iterative DFS; returns the cycle as a closed id sequence if one exists.
    static std::optional<std::vector<TaskId>> find_cycle(const DependencyGraph& graph);
    static std::vector<TaskId> topological_sort(const DependencyGraph& graph);
    static std::unordered_map<TaskId, size_t> calculate_depths(const DependencyGraph& graph);
    static std::vector<std::vector<TaskId>> group_by_depth(
        const DependencyGraph& graph, const std::unordered_map<TaskId, size_t>& depths);
};

}  // namespace workflow_orchestrator
