/**
 * @file execution_planner.hpp
 * @brief Execution plan structures and the planner that derives them.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/dependency_mapper.hpp"
#include "workload/subtask.hpp"

#include <optional>
#include <unordered_set>
#include <vector>

namespace workflow_orchestrator {

// ─────────────────────────────────────────────
// Execution Step & Plan
// ─────────────────────────────────────────────

struct ExecutionStep {
    size_t step_number = 0;                 ///< 1-based
    std::vector<TaskId> task_ids;
    bool can_parallelize = false;           ///< task_ids.size() > 1
};

struct ExecutionPlan {
    std::vector<ExecutionStep> steps;
    size_t total_steps = 0;
    bool can_parallelize = false;
    uint32_t estimated_duration_minutes = 0;
    std::vector<TaskId> critical_path;
    uint32_t critical_path_minutes = 0;
    Timestamp created_at{};
    std::optional<Error> error;

    [[nodiscard]] bool is_valid() const noexcept { return !error.has_value(); }
};

/**
 * @brief Converts a DependencyGraph into ordered execution steps.
 */
class ExecutionPlanner {
public:
    explicit ExecutionPlanner(PlannerConfig config = {});

    /// Empty plan with `error` set when the graph is cyclic or invalid.
    [[nodiscard]] ExecutionPlan create_plan(const DependencyGraph& graph,
                                            const std::vector<SubTask>& subtasks) const;

    /// Longest duration-weighted root-to-leaf chain; empty for empty or invalid graphs.
    [[nodiscard]] std::vector<TaskId> critical_path(const DependencyGraph& graph,
                                                    const std::vector<SubTask>& subtasks) const;

    [[nodiscard]] uint32_t estimate_duration(const std::vector<SubTask>& subtasks) const;

    /// Sum of the weights of the given ids.
    [[nodiscard]] uint32_t path_weight(const std::vector<TaskId>& path,
                                       const std::vector<SubTask>& subtasks) const;

    /// Not-yet-completed ids of the first step that still has work.
    [[nodiscard]] static std::vector<TaskId> next_tasks(const ExecutionPlan& plan,
                                                        const std::unordered_set<TaskId>& completed);

    [[nodiscard]] const ComplexityWeights& weights() const noexcept { return weights_; }

private:
    ComplexityWeights weights_;
};

}  // namespace workflow_orchestrator
