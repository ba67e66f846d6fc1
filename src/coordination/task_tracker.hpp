/**
 * @file task_tracker.hpp
 * @brief Per-workflow task state machine and its thread-safe registry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/subtask.hpp"

#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace workflow_orchestrator {

/**
 * @brief Runtime state of one subtask.
 *
 * Pending → Assigned → InProgress → {Completed | Failed | Blocked}.
 * Failed is also reachable from Pending and Assigned (dispatch can fail
 * before a worker starts). Terminal states accept no further transitions.
 * Mutators return InvalidTransition instead of overwriting state.
 */
class TrackedTask {
public:
    explicit TrackedTask(SubTask task);

    // ── Transitions ──────────────────────────
    Result<void> assign(const WorkerId& worker_id);
    Result<void> start();
    Result<void> update_progress(double progress);
    Result<void> complete(std::string result);
    Result<void> fail(std::string error);
    Result<void> block(std::vector<std::string> questions);

    // ── Observers ────────────────────────────
    [[nodiscard]] const TaskId& id() const noexcept { return task_.id; }
    [[nodiscard]] const SubTask& task() const noexcept { return task_; }
    [[nodiscard]] const std::vector<TaskId>& dependencies() const noexcept { return task_.dependencies; }
    [[nodiscard]] TaskStatus status() const noexcept { return status_; }
    [[nodiscard]] const std::optional<WorkerId>& worker_id() const noexcept { return worker_id_; }
    [[nodiscard]] double progress() const noexcept { return progress_; }
    [[nodiscard]] const std::optional<std::string>& result() const noexcept { return result_; }
    [[nodiscard]] const std::optional<std::string>& error() const noexcept { return error_; }
    [[nodiscard]] const std::vector<std::string>& questions() const noexcept { return questions_; }
    [[nodiscard]] Timestamp created_at() const noexcept { return created_at_; }
    [[nodiscard]] const std::optional<Timestamp>& assigned_at() const noexcept { return assigned_at_; }
    [[nodiscard]] const std::optional<Timestamp>& started_at() const noexcept { return started_at_; }
    [[nodiscard]] const std::optional<Timestamp>& completed_at() const noexcept { return completed_at_; }

    [[nodiscard]] std::string to_json() const;

private:
    Result<void> guard(std::initializer_list<TaskStatus> allowed, TaskStatus target) const;

    SubTask task_;
    TaskStatus status_ = TaskStatus::Pending;
    std::optional<WorkerId> worker_id_;
    double progress_ = 0.0;
    std::optional<std::string> result_;
    std::optional<std::string> error_;
    std::vector<std::string> questions_;
    Timestamp created_at_;
    std::optional<Timestamp> assigned_at_;
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> completed_at_;
};

struct TrackerStats {
    size_t total_tasks = 0;
    std::map<TaskStatus, size_t> status_counts;
    double overall_progress = 0.0;
    size_t ready_tasks = 0;
};

/**
 * @brief Single point of truth for task status within one workflow.
 *
 * Every read and write is serialized on one mutex so concurrently running
 * workers can report progress and completion without racing. Queries
 * return copies.
 */
class TaskStateTracker {
public:
    explicit TaskStateTracker(Logger& logger);

    Result<void> add_task(SubTask task);

    Result<void> assign(const TaskId& id, const WorkerId& worker_id);
    Result<void> start(const TaskId& id);
    Result<void> update_progress(const TaskId& id, double progress);
    Result<void> complete(const TaskId& id, std::string result);
    Result<void> fail(const TaskId& id, std::string error);
    Result<void> block(const TaskId& id, std::vector<std::string> questions = {});

    [[nodiscard]] std::optional<TrackedTask> get_task(const TaskId& id) const;
    [[nodiscard]] bool contains(const TaskId& id) const;

    /// Pending tasks whose every dependency is Completed, in insertion order.
    [[nodiscard]] std::vector<TrackedTask> get_ready_tasks() const;
    [[nodiscard]] bool is_ready(const TaskId& id) const;

    [[nodiscard]] std::vector<TrackedTask> tasks_by_status(TaskStatus status) const;
    [[nodiscard]] std::vector<TrackedTask> tasks_by_worker(const WorkerId& worker_id) const;
    [[nodiscard]] std::vector<TrackedTask> all_tasks() const;
    [[nodiscard]] std::vector<TaskId> task_ids() const;

    /// Mean of per-task progress; 0 when empty.
    [[nodiscard]] double get_overall_progress() const;
    [[nodiscard]] TrackerStats stats() const;
    [[nodiscard]] size_t size() const;

    void clear();

private:
    template <typename F>
    Result<void> mutate(const TaskId& id, const char* action, F&& transition);

    bool ready_locked(const TrackedTask& task) const;
    double progress_locked() const;

    Logger& logger_;
    mutable std::mutex mutex_;
    std::unordered_map<TaskId, TrackedTask> tasks_;
    std::vector<TaskId> order_;
};

}  // namespace workflow_orchestrator
