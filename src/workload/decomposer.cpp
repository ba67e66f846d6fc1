/**
 * @file decomposer.cpp
 * @brief TaskDecomposer and built-in strategies.
 *
 * Built-in templates are strict chains: task_n depends on task_{n-1}.
 * There is no fan-out in the shipped strategies; custom strategies
 * registered through register_strategy() may emit any DAG.
 */

#include "workload/decomposer.hpp"

#include <algorithm>
#include <chrono>

namespace workflow_orchestrator {

bool SubTask::depends_on(const TaskId& other) const {
    return std::find(dependencies.begin(), dependencies.end(), other) != dependencies.end();
}

std::vector<SubTask> make_chained_subtasks(
    const std::vector<std::pair<std::string, std::string>>& items,
    const TaskId& parent_id) {
    std::vector<SubTask> subtasks;
    subtasks.reserve(items.size());

    auto now = std::chrono::system_clock::now();
    for (size_t i = 0; i < items.size(); ++i) {
        SubTask task{
            .id = "task_" + std::to_string(i + 1),
            .description = items[i].first,
            .parent_id = parent_id,
            .dependencies = {},
            .domain = items[i].second,
            .complexity = Complexity::Simple,
            .status = TaskStatus::Pending,
            .created_at = now
        };
        if (i > 0) {
            task.dependencies.push_back(subtasks.back().id);
        }
        subtasks.push_back(std::move(task));
    }
    return subtasks;
}

// ─────────────────────────────────────────────
// PhaseTemplateStrategy
// ─────────────────────────────────────────────

PhaseTemplateStrategy::PhaseTemplateStrategy(std::string name, std::vector<Phase> phases)
    : name_(std::move(name)), phases_(std::move(phases)) {}

std::vector<SubTask> PhaseTemplateStrategy::decompose(const TaskAnalysis& analysis,
                                                      const TaskId& parent_id) const {
    std::vector<std::pair<std::string, std::string>> items;
    items.reserve(phases_.size());
    for (const auto& phase : phases_) {
        items.emplace_back(phase.title + " for " + analysis.description, phase.domain);
    }
    return make_chained_subtasks(items, parent_id);
}

// ─────────────────────────────────────────────
// GenericStrategy
// ─────────────────────────────────────────────

GenericStrategy::GenericStrategy(size_t max_subtasks) : max_subtasks_(max_subtasks) {}

std::vector<SubTask> GenericStrategy::decompose(const TaskAnalysis& analysis,
                                                const TaskId& parent_id) const {
    std::vector<std::string> fragments = analysis.key_requirements;
    if (fragments.empty()) {
        fragments = {"Analyze requirements", "Plan approach", "Execute task", "Verify results"};
    }
    if (fragments.size() > max_subtasks_) {
        fragments.resize(max_subtasks_);
    }

    std::vector<std::pair<std::string, std::string>> items;
    items.reserve(fragments.size());
    for (auto& fragment : fragments) {
        items.emplace_back(std::move(fragment), "general");
    }
    return make_chained_subtasks(items, parent_id);
}

// ─────────────────────────────────────────────
// TaskDecomposer
// ─────────────────────────────────────────────

TaskDecomposer::TaskDecomposer(DecomposerConfig config)
    : fallback_(config.max_generic_subtasks) {
    using Phase = PhaseTemplateStrategy::Phase;

    register_strategy("development", std::make_unique<PhaseTemplateStrategy>(
        "development", std::vector<Phase>{
            {"Requirements analysis", "development"},
            {"Design and architecture", "design"},
            {"Implementation", "development"},
            {"Testing", "testing"},
            {"Documentation", "development"}}));

    register_strategy("devops", std::make_unique<PhaseTemplateStrategy>(
        "devops", std::vector<Phase>{
            {"Infrastructure setup", "devops"},
            {"Configuration management", "devops"},
            {"Deployment pipeline", "devops"},
            {"Monitoring and logging", "devops"},
            {"Security hardening", "devops"}}));

    register_strategy("data", std::make_unique<PhaseTemplateStrategy>(
        "data", std::vector<Phase>{
            {"Data collection and preparation", "data"},
            {"Exploratory data analysis", "data"},
            {"Data processing and transformation", "data"},
            {"Analysis and modeling", "data"},
            {"Visualization and reporting", "data"}}));

    register_strategy("research", std::make_unique<PhaseTemplateStrategy>(
        "research", std::vector<Phase>{
            {"Define research scope and questions", "research"},
            {"Literature review and background research", "research"},
            {"Data gathering and analysis", "research"},
            {"Synthesis and conclusions", "research"},
            {"Documentation and presentation", "research"}}));
}

void TaskDecomposer::register_strategy(const std::string& domain,
                                       std::unique_ptr<IDecompositionStrategy> strategy) {
    strategies_[domain] = std::move(strategy);
}

const IDecompositionStrategy& TaskDecomposer::strategy_for(const std::string& domain) const {
    if (auto it = strategies_.find(domain); it != strategies_.end()) {
        return *it->second;
    }
    return fallback_;
}

Decomposition TaskDecomposer::decompose(const TaskAnalysis& analysis, uint32_t max_depth) const {
    const std::string primary = analysis.domains.empty() ? "general" : analysis.primary_domain();

    SubTask root{
        .id = std::string(kRootId),
        .description = analysis.description,
        .parent_id = std::nullopt,
        .dependencies = {},
        .domain = primary,
        .complexity = analysis.complexity,
        .status = TaskStatus::Pending,
        .created_at = std::chrono::system_clock::now()
    };

    Decomposition result;
    result.root_task = root;

    if (!analysis.requires_decomposition || max_depth == 0) {
        result.subtasks = {root};
        result.task_tree = {{root.id, {}}};
        return result;
    }

    result.subtasks = strategy_for(primary).decompose(analysis, root.id);
    result.task_tree = build_task_tree(root, result.subtasks);
    return result;
}

std::map<TaskId, std::vector<TaskId>> TaskDecomposer::build_task_tree(
    const SubTask& root, const std::vector<SubTask>& subtasks) {
    std::map<TaskId, std::vector<TaskId>> tree;
    tree[root.id];
    for (const auto& task : subtasks) {
        tree[task.id];
    }
    for (const auto& task : subtasks) {
        if (task.parent_id) {
            if (auto it = tree.find(*task.parent_id); it != tree.end()) {
                it->second.push_back(task.id);
            }
        }
    }
    return tree;
}

}  // namespace workflow_orchestrator
