/**
 * @file execution_planner.cpp
 * @brief ExecutionPlanner implementation: step layout and critical path.
 */

#include "scheduler/execution_planner.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>

namespace workflow_orchestrator {

namespace {

std::unordered_map<TaskId, uint32_t> weight_map(const std::vector<SubTask>& subtasks,
                                                const ComplexityWeights& weights) {
    std::unordered_map<TaskId, uint32_t> out;
    out.reserve(subtasks.size());
    for (const auto& task : subtasks) {
        out[task.id] = weights.of(task.complexity);
    }
    return out;
}

}  // namespace

ExecutionPlanner::ExecutionPlanner(PlannerConfig config)
    : weights_{config.simple_minutes, config.medium_minutes, config.complex_minutes} {}

ExecutionPlan ExecutionPlanner::create_plan(const DependencyGraph& graph,
                                            const std::vector<SubTask>& subtasks) const {
    ExecutionPlan plan;
    plan.created_at = std::chrono::system_clock::now();

    if (graph.has_cycles) {
        plan.error = Error{"Cannot create plan: circular dependency detected",
                           ErrorCode::CyclicDependency};
        return plan;
    }
    if (graph.error) {
        plan.error = Error{"Cannot create plan: " + graph.error->message, graph.error->code};
        return plan;
    }

    size_t step_number = 1;
    for (const auto& group : graph.parallel_groups) {
        plan.steps.push_back(ExecutionStep{
            .step_number = step_number++,
            .task_ids = group,
            .can_parallelize = group.size() > 1
        });
    }

    // Sequential fallback when only an order is available
    if (plan.steps.empty()) {
        for (const auto& id : graph.execution_order) {
            plan.steps.push_back(ExecutionStep{
                .step_number = step_number++,
                .task_ids = {id},
                .can_parallelize = false
            });
        }
    }

    plan.total_steps = plan.steps.size();
    plan.can_parallelize = std::any_of(plan.steps.begin(), plan.steps.end(),
        [](const ExecutionStep& s) { return s.can_parallelize; });
    plan.estimated_duration_minutes = estimate_duration(subtasks);
    plan.critical_path = critical_path(graph, subtasks);
    plan.critical_path_minutes = path_weight(plan.critical_path, subtasks);
    return plan;
}

uint32_t ExecutionPlanner::estimate_duration(const std::vector<SubTask>& subtasks) const {
    uint32_t total = 0;
    for (const auto& task : subtasks) {
        total += weights_.of(task.complexity);
    }
    return total;
}

uint32_t ExecutionPlanner::path_weight(const std::vector<TaskId>& path,
                                       const std::vector<SubTask>& subtasks) const {
    auto weights = weight_map(subtasks, weights_);
    uint32_t total = 0;
    for (const auto& id : path) {
        auto it = weights.find(id);
        total += it == weights.end() ? weights_.simple : it->second;
    }
    return total;
}

// ─────────────────────────────────────────────
// Critical Path (longest-path DP on topological order)
// ─────────────────────────────────────────────

std::vector<TaskId> ExecutionPlanner::critical_path(const DependencyGraph& graph,
                                                    const std::vector<SubTask>& subtasks) const {
    if (!graph.is_valid() || graph.execution_order.empty()) return {};

    auto weights = weight_map(subtasks, weights_);
    auto weight_of = [&](const TaskId& id) {
        auto it = weights.find(id);
        return it == weights.end() ? weights_.simple : it->second;
    };

    // dist[v] = heaviest chain ending just before v (v's own weight excluded)
    std::unordered_map<TaskId, uint64_t> dist;
    std::unordered_map<TaskId, std::optional<TaskId>> predecessor;
    for (const auto& id : graph.execution_order) {
        dist[id] = 0;
        predecessor[id] = std::nullopt;
    }

    for (const auto& u : graph.execution_order) {
        uint64_t through_u = dist[u] + weight_of(u);
        for (const auto& v : graph.dependents(u)) {
            if (through_u > dist[v]) {
                dist[v] = through_u;
                predecessor[v] = u;
            }
        }
    }

    // End node maximises the inclusive weight; first in topological order wins ties
    TaskId end_task = graph.execution_order.front();
    uint64_t best = 0;
    for (const auto& id : graph.execution_order) {
        uint64_t inclusive = dist[id] + weight_of(id);
        if (inclusive > best) {
            best = inclusive;
            end_task = id;
        }
    }

    std::vector<TaskId> path;
    std::optional<TaskId> current = end_task;
    while (current) {
        path.push_back(*current);
        current = predecessor[*current];
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<TaskId> ExecutionPlanner::next_tasks(const ExecutionPlan& plan,
                                                 const std::unordered_set<TaskId>& completed) {
    for (const auto& step : plan.steps) {
        std::vector<TaskId> pending;
        for (const auto& id : step.task_ids) {
            if (!completed.contains(id)) pending.push_back(id);
        }
        if (!pending.empty()) return pending;
    }
    return {};
}

}  // namespace workflow_orchestrator
