/**
 * @file dependency_mapper.cpp
 * @brief DependencyMapper implementation: graph algorithms.
 *
 * Kahn's algorithm for topological ordering, iterative DFS with a colour
 * map for cycle detection, and a BFS depth pass (same in-degree decrement
 * scheme as Kahn) for parallel groups. All passes are O(V+E).
 */

#include "workload/dependency_mapper.hpp"

#include <algorithm>
#include <map>
#include <queue>

namespace workflow_orchestrator {

namespace {

const std::vector<TaskId> kNoDependents;

std::string join_path(const std::vector<TaskId>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " -> ";
        out += path[i];
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────
// DependencyGraph queries
// ─────────────────────────────────────────────

const std::vector<TaskId>& DependencyGraph::dependents(const TaskId& id) const {
    auto it = adjacency.find(id);
    return it == adjacency.end() ? kNoDependents : it->second;
}

size_t DependencyGraph::in_degree_of(const TaskId& id) const {
    auto it = in_degree.find(id);
    return it == in_degree.end() ? 0 : it->second;
}

std::optional<size_t> DependencyGraph::depth_of(const TaskId& id) const {
    auto it = depths.find(id);
    if (it == depths.end()) return std::nullopt;
    return it->second;
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> DependencyMapper::validate(const std::vector<SubTask>& subtasks) {
    std::unordered_set<TaskId> ids;
    ids.reserve(subtasks.size());

    for (const auto& task : subtasks) {
        if (!ids.insert(task.id).second) {
            return Error{"Duplicate subtask id: " + task.id, ErrorCode::DuplicateTaskId};
        }
    }

    for (const auto& task : subtasks) {
        for (const auto& dep : task.dependencies) {
            if (!ids.contains(dep)) {
                return Error{"Subtask " + task.id + " depends on unknown task " + dep,
                             ErrorCode::UnknownTaskReference};
            }
        }
    }

    return Result<void>{};
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DependencyGraph DependencyMapper::build_graph(const std::vector<SubTask>& subtasks) const {
    DependencyGraph graph;

    if (auto valid = validate(subtasks); !valid) {
        graph.error = valid.error();
        return graph;
    }

    graph.nodes.reserve(subtasks.size());
    for (const auto& task : subtasks) {
        graph.nodes.push_back(task.id);
        graph.adjacency[task.id];
        graph.in_degree[task.id];
    }

    for (const auto& task : subtasks) {
        std::unordered_set<TaskId> seen;
        for (const auto& dep : task.dependencies) {
            if (!seen.insert(dep).second) continue;
            graph.adjacency[dep].push_back(task.id);
            ++graph.in_degree[task.id];
        }
    }

    if (auto cycle = find_cycle(graph)) {
        graph.has_cycles = true;
        graph.error = Error{"Circular dependency detected: " + join_path(*cycle),
                            ErrorCode::CyclicDependency};
        return graph;
    }

    graph.execution_order = topological_sort(graph);
    graph.depths = calculate_depths(graph);
    graph.parallel_groups = group_by_depth(graph, graph.depths);
    return graph;
}

// ─────────────────────────────────────────────
// Cycle Detection (iterative DFS)
// ─────────────────────────────────────────────

std::optional<std::vector<TaskId>> DependencyMapper::find_cycle(const DependencyGraph& graph) {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;
    for (const auto& id : graph.nodes) {
        color[id] = Color::White;
    }

    struct Frame {
        TaskId node;
        size_t neighbor_idx;
    };

    for (const auto& start_id : graph.nodes) {
        if (color[start_id] != Color::White) continue;

        // std::vector instead of std::stack so the active path can be read back
        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start_id, 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.back();
            const auto& neighbors = graph.dependents(node);

            if (idx >= neighbors.size()) {
                color[node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            const auto neighbor = neighbors[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                std::vector<TaskId> cycle;
                auto it = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                       [&](const Frame& f) { return f.node == neighbor; });
                for (; it != dfs_stack.end(); ++it) {
                    cycle.push_back(it->node);
                }
                cycle.push_back(neighbor);
                return cycle;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push_back({neighbor, 0});
            }
        }
    }

    return std::nullopt;
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> DependencyMapper::topological_sort(const DependencyGraph& graph) {
    auto in_degree = graph.in_degree;

    std::queue<TaskId> zero_in;
    for (const auto& id : graph.nodes) {
        if (in_degree[id] == 0) {
            zero_in.push(id);
        }
    }

    std::vector<TaskId> order;
    order.reserve(graph.nodes.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        for (const auto& neighbor : graph.dependents(current)) {
            if (--in_degree[neighbor] == 0) {
                zero_in.push(neighbor);
            }
        }
    }

    return order;
}

// ─────────────────────────────────────────────
// Parallel Groups (BFS depth levels)
// ─────────────────────────────────────────────

std::unordered_map<TaskId, size_t> DependencyMapper::calculate_depths(const DependencyGraph& graph) {
    auto in_degree = graph.in_degree;
    std::unordered_map<TaskId, size_t> depths;

    std::queue<std::pair<TaskId, size_t>> frontier;
    for (const auto& id : graph.nodes) {
        if (in_degree[id] == 0) {
            frontier.emplace(id, 0);
        }
    }

    while (!frontier.empty()) {
        auto [node, depth] = frontier.front();
        frontier.pop();
        depths[node] = depth;

        for (const auto& neighbor : graph.dependents(node)) {
            if (--in_degree[neighbor] == 0) {
                frontier.emplace(neighbor, depth + 1);
            }
        }
    }

    return depths;
}

std::vector<std::vector<TaskId>> DependencyMapper::group_by_depth(
    const DependencyGraph& graph, const std::unordered_map<TaskId, size_t>& depths) {
    // Iterating nodes in insertion order keeps each group stable
    std::map<size_t, std::vector<TaskId>> by_depth;
    for (const auto& id : graph.nodes) {
        if (auto it = depths.find(id); it != depths.end()) {
            by_depth[it->second].push_back(id);
        }
    }

    std::vector<std::vector<TaskId>> groups;
    groups.reserve(by_depth.size());
    for (auto& [depth, group] : by_depth) {
        groups.push_back(std::move(group));
    }
    return groups;
}

// ─────────────────────────────────────────────
// Ready Tasks
// ─────────────────────────────────────────────

std::vector<TaskId> DependencyMapper::ready_tasks(const std::unordered_set<TaskId>& completed,
                                                  const std::vector<SubTask>& subtasks) {
    std::vector<TaskId> ready;
    for (const auto& task : subtasks) {
        if (completed.contains(task.id)) continue;

        bool all_deps_met = std::all_of(task.dependencies.begin(), task.dependencies.end(),
            [&](const TaskId& dep) { return completed.contains(dep); });
        if (all_deps_met) {
            ready.push_back(task.id);
        }
    }
    return ready;
}

}  // namespace workflow_orchestrator
