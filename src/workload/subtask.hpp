/**
 * @file subtask.hpp
 * @brief SubTask: one schedulable unit produced by decomposition.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace workflow_orchestrator {

/**
 * @brief A single node of a decomposed workflow.
 *
 * `dependencies` has set semantics (order is kept for stable output,
 * duplicates are ignored by the mapper). `parent_id` is lineage only;
 * scheduling never looks at it.
 */
struct SubTask {
    TaskId id;
    std::string description;
    std::optional<TaskId> parent_id;
    std::vector<TaskId> dependencies;
    std::string domain = "general";
    Complexity complexity = Complexity::Simple;
    TaskStatus status = TaskStatus::Pending;
    Timestamp created_at{};

    [[nodiscard]] bool depends_on(const TaskId& other) const;
};

/// Duration weight of a subtask in minutes for a given complexity tier.
struct ComplexityWeights {
    uint32_t simple = 5;
    uint32_t medium = 15;
    uint32_t complex = 30;

    [[nodiscard]] constexpr uint32_t of(Complexity c) const noexcept {
        switch (c) {
            case Complexity::Simple:  return simple;
            case Complexity::Medium:  return medium;
            case Complexity::Complex: return complex;
        }
        return simple;
    }
};

}  // namespace workflow_orchestrator
