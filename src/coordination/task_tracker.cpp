/**
 * @file task_tracker.cpp
 * @brief TrackedTask transitions and TaskStateTracker bookkeeping.
 */

#include "coordination/task_tracker.hpp"
#include "core/json.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace workflow_orchestrator {

namespace {

constexpr std::string_view kComponent = "tracker";

Timestamp now() { return std::chrono::system_clock::now(); }

std::string optional_time(const std::optional<Timestamp>& ts) {
    return ts ? json_quote(format_timestamp(*ts)) : std::string{"null"};
}

std::string optional_string(const std::optional<std::string>& s) {
    return s ? json_quote(*s) : std::string{"null"};
}

}  // namespace

// ─────────────────────────────────────────────
// TrackedTask
// ─────────────────────────────────────────────

TrackedTask::TrackedTask(SubTask task)
    : task_(std::move(task)), created_at_(now()) {
    task_.status = TaskStatus::Pending;
}

Result<void> TrackedTask::guard(std::initializer_list<TaskStatus> allowed, TaskStatus target) const {
    if (std::find(allowed.begin(), allowed.end(), status_) != allowed.end()) {
        return Result<void>{};
    }
    return Error{"Task " + task_.id + ": illegal transition "
                 + std::string(to_string(status_)) + " -> " + std::string(to_string(target)),
                 ErrorCode::InvalidTransition};
}

Result<void> TrackedTask::assign(const WorkerId& worker_id) {
    if (auto ok = guard({TaskStatus::Pending}, TaskStatus::Assigned); !ok) return ok;
    status_ = TaskStatus::Assigned;
    worker_id_ = worker_id;
    assigned_at_ = now();
    task_.status = status_;
    return Result<void>{};
}

Result<void> TrackedTask::start() {
    if (auto ok = guard({TaskStatus::Assigned}, TaskStatus::InProgress); !ok) return ok;
    status_ = TaskStatus::InProgress;
    started_at_ = now();
    task_.status = status_;
    return Result<void>{};
}

Result<void> TrackedTask::update_progress(double progress) {
    if (status_ != TaskStatus::InProgress) {
        return Error{"Task " + task_.id + ": progress update while "
                     + std::string(to_string(status_)), ErrorCode::InvalidTransition};
    }
    if (!std::isfinite(progress)) {
        return Error{"Task " + task_.id + ": progress must be a finite number",
                     ErrorCode::InvalidTransition};
    }
    progress_ = std::clamp(progress, 0.0, 1.0);
    return Result<void>{};
}

Result<void> TrackedTask::complete(std::string result) {
    if (auto ok = guard({TaskStatus::InProgress}, TaskStatus::Completed); !ok) return ok;
    status_ = TaskStatus::Completed;
    result_ = std::move(result);
    progress_ = 1.0;
    completed_at_ = now();
    task_.status = status_;
    return Result<void>{};
}

Result<void> TrackedTask::fail(std::string error) {
    if (auto ok = guard({TaskStatus::Pending, TaskStatus::Assigned, TaskStatus::InProgress},
                        TaskStatus::Failed); !ok) {
        return ok;
    }
    status_ = TaskStatus::Failed;
    error_ = std::move(error);
    completed_at_ = now();
    task_.status = status_;
    return Result<void>{};
}

Result<void> TrackedTask::block(std::vector<std::string> questions) {
    if (auto ok = guard({TaskStatus::InProgress}, TaskStatus::Blocked); !ok) return ok;
    status_ = TaskStatus::Blocked;
    questions_ = std::move(questions);
    task_.status = status_;
    return Result<void>{};
}

std::string TrackedTask::to_json() const {
    std::ostringstream oss;
    oss << R"({"task_id":)" << json_quote(task_.id)
        << R"(,"description":)" << json_quote(task_.description)
        << R"(,"domain":)" << json_quote(task_.domain)
        << R"(,"worker_id":)" << optional_string(worker_id_)
        << R"(,"status":")" << to_string(status_) << "\""
        << R"(,"progress":)" << progress_
        << R"(,"dependencies":)" << json_array(task_.dependencies)
        << R"(,"result":)" << optional_string(result_)
        << R"(,"error":)" << optional_string(error_)
        << R"(,"questions":)" << json_array(questions_)
        << R"(,"created_at":)" << json_quote(format_timestamp(created_at_))
        << R"(,"assigned_at":)" << optional_time(assigned_at_)
        << R"(,"started_at":)" << optional_time(started_at_)
        << R"(,"completed_at":)" << optional_time(completed_at_)
        << "}";
    return oss.str();
}

// ─────────────────────────────────────────────
// TaskStateTracker
// ─────────────────────────────────────────────

TaskStateTracker::TaskStateTracker(Logger& logger) : logger_(logger) {}

Result<void> TaskStateTracker::add_task(SubTask task) {
    std::lock_guard lock(mutex_);
    if (tasks_.contains(task.id)) {
        logger_.warn("Task " + task.id + " already exists", kComponent);
        return Error{"Task already tracked: " + task.id, ErrorCode::DuplicateTaskId};
    }
    auto id = task.id;
    tasks_.emplace(id, TrackedTask(std::move(task)));
    order_.push_back(id);
    logger_.debug("Added task: " + id, kComponent);
    return Result<void>{};
}

template <typename F>
Result<void> TaskStateTracker::mutate(const TaskId& id, const char* action, F&& transition) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        logger_.error("Task " + id + " not found", kComponent);
        return Error{"Task not found: " + id, ErrorCode::TaskNotFound};
    }
    auto result = transition(it->second);
    if (!result) {
        logger_.warn(std::string(action) + " rejected: " + result.error().message, kComponent);
    }
    return result;
}

Result<void> TaskStateTracker::assign(const TaskId& id, const WorkerId& worker_id) {
    auto r = mutate(id, "assign", [&](TrackedTask& t) { return t.assign(worker_id); });
    if (r) logger_.info("Assigned task " + id + " to worker " + worker_id, kComponent);
    return r;
}

Result<void> TaskStateTracker::start(const TaskId& id) {
    auto r = mutate(id, "start", [](TrackedTask& t) { return t.start(); });
    if (r) logger_.info("Task " + id + " started", kComponent);
    return r;
}

Result<void> TaskStateTracker::update_progress(const TaskId& id, double progress) {
    return mutate(id, "update_progress", [&](TrackedTask& t) { return t.update_progress(progress); });
}

Result<void> TaskStateTracker::complete(const TaskId& id, std::string result) {
    auto r = mutate(id, "complete", [&](TrackedTask& t) { return t.complete(std::move(result)); });
    if (r) logger_.info("Task " + id + " completed", kComponent);
    return r;
}

Result<void> TaskStateTracker::fail(const TaskId& id, std::string error) {
    std::string message = error;
    auto r = mutate(id, "fail", [&](TrackedTask& t) { return t.fail(std::move(error)); });
    if (r) logger_.error("Task " + id + " failed: " + message, kComponent);
    return r;
}

Result<void> TaskStateTracker::block(const TaskId& id, std::vector<std::string> questions) {
    auto r = mutate(id, "block", [&](TrackedTask& t) { return t.block(std::move(questions)); });
    if (r) logger_.warn("Task " + id + " blocked awaiting clarification", kComponent);
    return r;
}

std::optional<TrackedTask> TaskStateTracker::get_task(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

bool TaskStateTracker::contains(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    return tasks_.contains(id);
}

bool TaskStateTracker::ready_locked(const TrackedTask& task) const {
    if (task.status() != TaskStatus::Pending) return false;
    return std::all_of(task.dependencies().begin(), task.dependencies().end(),
        [this](const TaskId& dep) {
            auto it = tasks_.find(dep);
            return it != tasks_.end() && it->second.status() == TaskStatus::Completed;
        });
}

std::vector<TrackedTask> TaskStateTracker::get_ready_tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<TrackedTask> ready;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (ready_locked(task)) ready.push_back(task);
    }
    return ready;
}

bool TaskStateTracker::is_ready(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    return it != tasks_.end() && ready_locked(it->second);
}

std::vector<TrackedTask> TaskStateTracker::tasks_by_status(TaskStatus status) const {
    std::lock_guard lock(mutex_);
    std::vector<TrackedTask> out;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (task.status() == status) out.push_back(task);
    }
    return out;
}

std::vector<TrackedTask> TaskStateTracker::tasks_by_worker(const WorkerId& worker_id) const {
    std::lock_guard lock(mutex_);
    std::vector<TrackedTask> out;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (task.worker_id() == worker_id) out.push_back(task);
    }
    return out;
}

std::vector<TrackedTask> TaskStateTracker::all_tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<TrackedTask> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(tasks_.at(id));
    }
    return out;
}

std::vector<TaskId> TaskStateTracker::task_ids() const {
    std::lock_guard lock(mutex_);
    return order_;
}

double TaskStateTracker::progress_locked() const {
    if (tasks_.empty()) return 0.0;
    double total = 0.0;
    for (const auto& [id, task] : tasks_) {
        total += task.progress();
    }
    return total / static_cast<double>(tasks_.size());
}

double TaskStateTracker::get_overall_progress() const {
    std::lock_guard lock(mutex_);
    return progress_locked();
}

TrackerStats TaskStateTracker::stats() const {
    std::lock_guard lock(mutex_);
    TrackerStats s;
    s.total_tasks = tasks_.size();
    for (auto status : {TaskStatus::Pending, TaskStatus::Assigned, TaskStatus::InProgress,
                        TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Blocked}) {
        s.status_counts[status] = 0;
    }
    for (const auto& [id, task] : tasks_) {
        ++s.status_counts[task.status()];
        if (ready_locked(task)) ++s.ready_tasks;
    }
    s.overall_progress = progress_locked();
    return s;
}

size_t TaskStateTracker::size() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void TaskStateTracker::clear() {
    std::lock_guard lock(mutex_);
    tasks_.clear();
    order_.clear();
}

}  // namespace workflow_orchestrator
