/**
 * @file decomposer.hpp
 * @brief Template-driven task decomposition into chained subtasks.
 */

#pragma once

#include "analysis/task_analyzer.hpp"
#include "core/config.hpp"
#include "workload/subtask.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace workflow_orchestrator {

/**
 * @brief Output of TaskDecomposer::decompose.
 *
 * `subtasks` is what gets scheduled. When no decomposition is needed it
 * holds exactly one element equal to `root_task`; otherwise the root is
 * lineage only and is not part of the list.
 */
struct Decomposition {
    SubTask root_task;
    std::vector<SubTask> subtasks;
    std::map<TaskId, std::vector<TaskId>> task_tree;   ///< id -> direct children
};

/**
 * @brief Abstract interface for decomposition strategies.
 */
class IDecompositionStrategy {
public:
    virtual ~IDecompositionStrategy() = default;
    virtual std::vector<SubTask> decompose(const TaskAnalysis& analysis,
                                           const TaskId& parent_id) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Emits a fixed sequence of phases, each depending on the previous one.
 */
class PhaseTemplateStrategy final : public IDecompositionStrategy {
public:
    struct Phase {
        std::string title;
        std::string domain;
    };

    PhaseTemplateStrategy(std::string name, std::vector<Phase> phases);

    std::vector<SubTask> decompose(const TaskAnalysis& analysis,
                                   const TaskId& parent_id) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] const std::vector<Phase>& phases() const noexcept { return phases_; }

private:
    std::string name_;
    std::vector<Phase> phases_;
};

/**
 * @brief Slices the analyzer's requirement fragments into sequential subtasks.
 */
class GenericStrategy final : public IDecompositionStrategy {
public:
    explicit GenericStrategy(size_t max_subtasks = 5);

    std::vector<SubTask> decompose(const TaskAnalysis& analysis,
                                   const TaskId& parent_id) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "general"; }

private:
    size_t max_subtasks_;
};

/**
 * @brief Selects a strategy by primary domain and builds the task tree.
 */
class TaskDecomposer {
public:
    static constexpr std::string_view kRootId = "task_0";

    explicit TaskDecomposer(DecomposerConfig config = {});

    [[nodiscard]] Decomposition decompose(const TaskAnalysis& analysis,
                                          uint32_t max_depth = 3) const;

    /// Register or replace the strategy used for a primary domain.
    void register_strategy(const std::string& domain,
                           std::unique_ptr<IDecompositionStrategy> strategy);

    [[nodiscard]] const IDecompositionStrategy& strategy_for(const std::string& domain) const;

    static std::map<TaskId, std::vector<TaskId>> build_task_tree(
        const SubTask& root, const std::vector<SubTask>& subtasks);

private:
    std::unordered_map<std::string, std::unique_ptr<IDecompositionStrategy>> strategies_;
    GenericStrategy fallback_;
};

/// Build chained subtasks `task_1..task_n` from (description, domain) pairs.
std::vector<SubTask> make_chained_subtasks(const std::vector<std::pair<std::string, std::string>>& items,
                                           const TaskId& parent_id);

}  // namespace workflow_orchestrator
