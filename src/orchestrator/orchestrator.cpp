/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation: planning phase and step-wise dispatch.
 */

#include "orchestrator/orchestrator.hpp"
#include "core/json.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <functional>
#include <sstream>
#include <unordered_map>

namespace workflow_orchestrator {

namespace {

constexpr std::string_view kComponent = "orchestrator";
constexpr std::string_view kTelemetrySubscriber = "telemetry";

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::string join_lines(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += '\n';
        out += item;
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────
// Construction & Lifecycle
// ─────────────────────────────────────────────

Orchestrator::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , analyzer_(config_.analyzer)
    , decomposer_(config_.decomposer)
    , planner_(config_.planner)
    , bus_(logger_, config_.bus.history_capacity, config_.bus.default_history_limit)
    , tracker_(logger_)
    , aggregator_(logger_)
    , thread_pool_(config_.executor.thread_count)
    , metrics_(or_null_sink(std::move(opts.metrics_sink))) {
    register_telemetry();
}

Orchestrator::~Orchestrator() {
    stop();
}

Result<void> Orchestrator::start() {
    if (running_.exchange(true)) {
        return Error{"Orchestrator already running", ErrorCode::InvalidState};
    }
    bus_.start();
    logger_.info("Orchestrator started: id=" + config_.orchestrator.id
                 + " threads=" + std::to_string(thread_pool_.thread_count()), kComponent);
    return Result<void>{};
}

void Orchestrator::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Orchestrator shutting down...", kComponent);
    bus_.stop();
    metrics_.flush();
    logger_.info("Orchestrator stopped", kComponent);
    logger_.flush();
}

void Orchestrator::register_worker(const std::string& domain, std::shared_ptr<IWorker> worker) {
    workers_.register_worker(domain, std::move(worker));
}

void Orchestrator::set_default_worker(std::shared_ptr<IWorker> worker) {
    workers_.set_default(std::move(worker));
}

void Orchestrator::register_decomposition_strategy(
    const std::string& domain, std::unique_ptr<IDecompositionStrategy> strategy) {
    std::lock_guard run_lock(run_mutex_);
    decomposer_.register_strategy(domain, std::move(strategy));
}

void Orchestrator::register_telemetry() {
    for (auto type : {MessageType::TaskAssigned, MessageType::TaskStarted,
                      MessageType::TaskProgress, MessageType::TaskCompleted,
                      MessageType::TaskFailed, MessageType::SystemEvent}) {
        bus_.subscribe(type, std::string(kTelemetrySubscriber), [this](const Message& message) {
            metrics_.record_bus_message(message);
        });
    }
}

// ─────────────────────────────────────────────
// Planning
// ─────────────────────────────────────────────

Result<WorkflowPlan> Orchestrator::plan_task(std::string_view description) {
    WorkflowPlan wp;
    wp.analysis = analyzer_.analyze(description);
    logger_.info("Task complexity: " + std::string(to_string(wp.analysis.complexity))
                 + ", primary domain: " + wp.analysis.primary_domain(), kComponent);

    wp.decomposition = decomposer_.decompose(wp.analysis, config_.orchestrator.max_decomposition_depth);
    logger_.info("Decomposed into " + std::to_string(wp.decomposition.subtasks.size())
                 + " subtask(s)", kComponent);

    wp.graph = mapper_.build_graph(wp.decomposition.subtasks);
    wp.plan = planner_.create_plan(wp.graph, wp.decomposition.subtasks);
    if (wp.plan.error) {
        logger_.error("Planning failed: " + wp.plan.error->message, kComponent);
        return *wp.plan.error;
    }

    logger_.info("Execution plan: " + std::to_string(wp.plan.total_steps) + " steps, parallel="
                 + (wp.plan.can_parallelize ? "true" : "false"), kComponent);
    return wp;
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<WorkflowResult> Orchestrator::execute_task(const std::string& description,
                                                  const TaskContext& context) {
    if (!running_.load()) {
        return Error{"Orchestrator not started", ErrorCode::InvalidState};
    }

    std::lock_guard run_lock(run_mutex_);
    auto start_time = std::chrono::steady_clock::now();
    auto workflow_id = config_.orchestrator.id + "_wf_" + std::to_string(workflow_seq_.fetch_add(1) + 1);

    logger_.info("Orchestrating " + workflow_id + ": " + description.substr(0, 100), kComponent);
    state_.store(WorkflowState::Planning);
    tracker_.clear();
    aggregator_.clear();

    auto planned = plan_task(description);
    if (!planned) {
        state_.store(WorkflowState::Failed);
        return planned.error();
    }
    const auto& wp = planned.value();
    const auto& subtasks = wp.decomposition.subtasks;

    std::vector<TaskId> task_ids;
    task_ids.reserve(subtasks.size());
    for (const auto& task : subtasks) {
        if (auto added = tracker_.add_task(task); !added) {
            state_.store(WorkflowState::Failed);
            return added.error();
        }
        task_ids.push_back(task.id);
    }
    {
        std::lock_guard lock(last_run_mutex_);
        last_task_ids_ = task_ids;
    }
    metrics_.record_plan(workflow_id, wp.plan);

    state_.store(WorkflowState::Executing);
    for (const auto& step : wp.plan.steps) {
        logger_.info("Executing step " + std::to_string(step.step_number) + "/"
                     + std::to_string(wp.plan.total_steps), kComponent);
        run_step(step, subtasks, workflow_id, context);
    }
    bus_.wait_idle();

    WorkflowResult result{
        .workflow_id = workflow_id,
        .total_steps = wp.plan.total_steps,
        .can_parallelize = wp.plan.can_parallelize,
        .critical_path = wp.plan.critical_path,
        .critical_path_length = wp.plan.critical_path.size(),
        .critical_path_minutes = wp.plan.critical_path_minutes,
        .estimated_duration_minutes = wp.plan.estimated_duration_minutes,
        .overall_progress = tracker_.get_overall_progress()
    };
    for (const auto& task : tracker_.all_tasks()) {
        switch (task.status()) {
            case TaskStatus::Completed: result.completed.push_back(task.id()); break;
            case TaskStatus::Failed:    result.failed.push_back(task.id()); break;
            case TaskStatus::Blocked:   result.blocked.push_back(task.id()); break;
            default:                    result.skipped.push_back(task.id()); break;
        }
    }

    if (result.completed.size() == task_ids.size()) {
        result.status = WorkflowStatus::Completed;
    } else if (result.completed.empty() && !result.failed.empty()) {
        result.status = WorkflowStatus::Failed;
    } else {
        result.status = WorkflowStatus::Degraded;
    }

    result.results = aggregator_.aggregate_workflow_results(task_ids);
    result.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start_time);

    state_.store(result.status == WorkflowStatus::Failed ? WorkflowState::Failed
                                                         : WorkflowState::Completed);
    metrics_.record_workflow_complete(workflow_id, to_string(result.status),
                                      result.completed.size(), result.failed.size(),
                                      result.blocked.size(), result.skipped.size(),
                                      result.duration);
    logger_.info("Workflow " + workflow_id + " finished: " + std::string(to_string(result.status)),
                 kComponent);
    return result;
}

void Orchestrator::run_step(const ExecutionStep& step,
                            const std::vector<SubTask>& subtasks,
                            const WorkflowId& workflow_id,
                            const TaskContext& context) {
    std::unordered_map<TaskId, const SubTask*> by_id;
    for (const auto& task : subtasks) {
        by_id.emplace(task.id, &task);
    }

    struct Dispatchable {
        const SubTask* task;
        std::shared_ptr<IWorker> worker;
    };
    std::vector<Dispatchable> ready;

    for (const auto& id : step.task_ids) {
        auto it = by_id.find(id);
        if (it == by_id.end()) {
            logger_.error("Plan references unknown task " + id, kComponent);
            continue;
        }
        const SubTask& task = *it->second;

        if (!tracker_.is_ready(task.id)) {
            logger_.warn("Skipping task " + task.id + ": dependencies not completed", kComponent);
            continue;
        }

        auto worker = workers_.select(task.domain);
        if (!worker) {
            fail_undispatched(task, "No worker registered for domain '" + task.domain + "'");
            continue;
        }
        ready.push_back(Dispatchable{&task, std::move(worker)});
    }

    if (config_.executor.parallel_dispatch && ready.size() > 1) {
        std::vector<std::function<bool()>> jobs;
        jobs.reserve(ready.size());
        for (const auto& d : ready) {
            jobs.emplace_back([this, d, &step, &workflow_id, &context] {
                dispatch(*d.task, d.worker, step.step_number, workflow_id, context);
                return true;
            });
        }
        thread_pool_.run_all(std::move(jobs));
        return;
    }

    for (const auto& d : ready) {
        dispatch(*d.task, d.worker, step.step_number, workflow_id, context);
    }
}

void Orchestrator::dispatch(const SubTask& task,
                            const std::shared_ptr<IWorker>& worker,
                            size_t step_number,
                            const WorkflowId& workflow_id,
                            const TaskContext& context) {
    const auto& sender = config_.orchestrator.id;
    const auto& worker_id = worker->id();

    bus_.publish(MessageType::TaskAssigned, sender, {
        {"task_id", task.id},
        {"description", task.description},
        {"worker_id", worker_id},
        {"workflow_id", workflow_id},
        {"step", std::to_string(step_number)}
    });
    check(tracker_.assign(task.id, worker_id), "assign");
    check(tracker_.start(task.id), "start");
    bus_.publish(MessageType::TaskStarted, worker_id, {{"task_id", task.id}});

    TaskContext task_context = context;
    task_context["task_id"] = task.id;
    task_context["workflow_id"] = workflow_id;
    task_context["domain"] = task.domain;
    task_context["step"] = std::to_string(step_number);

    auto exec = task_runner_.execute(task, *worker, task_context);
    metrics_.record_task_event(task.id, exec.final_state, exec.actual_duration);

    switch (exec.final_state) {
        case TaskStatus::Completed: {
            const auto& output = exec.worker_result.output;
            check(tracker_.complete(task.id, output), "complete");
            aggregator_.add_result(task.id, worker_id, output, exec.worker_result.metadata);
            bus_.publish(MessageType::TaskCompleted, worker_id, {
                {"task_id", task.id},
                {"result", output}
            });
            break;
        }
        case TaskStatus::Blocked: {
            check(tracker_.block(task.id, exec.worker_result.questions), "block");
            bus_.publish(MessageType::SystemEvent, worker_id, {
                {"event", "clarification_needed"},
                {"task_id", task.id},
                {"questions", join_lines(exec.worker_result.questions)}
            });
            break;
        }
        default: {
            auto error = exec.error_message.value_or("Worker reported an error");
            check(tracker_.fail(task.id, error), "fail");
            bus_.publish(MessageType::TaskFailed, sender, {
                {"task_id", task.id},
                {"error", error}
            });
            break;
        }
    }
}

void Orchestrator::fail_undispatched(const SubTask& task, const std::string& reason) {
    check(tracker_.fail(task.id, reason), "fail");
    metrics_.record_task_event(task.id, TaskStatus::Failed, Duration{0});
    bus_.publish(MessageType::TaskFailed, config_.orchestrator.id, {
        {"task_id", task.id},
        {"error", reason}
    });
}

void Orchestrator::check(const Result<void>& result, std::string_view action) {
    if (!result) {
        logger_.error("Tracker rejected " + std::string(action) + ": " + result.error().message,
                      kComponent);
    }
}

Result<void> Orchestrator::report_progress(const TaskId& task_id, double progress) {
    auto updated = tracker_.update_progress(task_id, progress);
    if (!updated) return updated;

    // Publish the stored value, which the tracker has clamped to [0, 1]
    std::ostringstream value;
    value << tracker_.get_task(task_id).value().progress();
    bus_.publish(MessageType::TaskProgress, config_.orchestrator.id, {
        {"task_id", task_id},
        {"progress", value.str()}
    });
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Observation
// ─────────────────────────────────────────────

OrchestratorProgress Orchestrator::get_progress() const {
    return OrchestratorProgress{
        .state = state_.load(),
        .overall_progress = tracker_.get_overall_progress(),
        .task_stats = tracker_.stats(),
        .result_stats = aggregator_.stats(),
        .message_stats = bus_.stats()
    };
}

std::optional<TrackedTask> Orchestrator::get_task_status(const TaskId& task_id) const {
    return tracker_.get_task(task_id);
}

std::string Orchestrator::get_results(OutputFormat format,
                                      std::optional<std::vector<TaskId>> task_ids) const {
    if (!task_ids) {
        std::lock_guard lock(last_run_mutex_);
        task_ids = last_task_ids_;
    }
    return aggregator_.format_final_output(*task_ids, format);
}

std::string to_json(const WorkflowResult& result) {
    std::ostringstream oss;
    oss << R"({"workflow_id":)" << json_quote(result.workflow_id)
        << R"(,"status":")" << to_string(result.status) << "\""
        << R"(,"execution":{"total_steps":)" << result.total_steps
        << R"(,"can_parallelize":)" << (result.can_parallelize ? "true" : "false")
        << R"(,"critical_path":)" << json_array(result.critical_path)
        << R"(,"critical_path_length":)" << result.critical_path_length
        << R"(,"critical_path_minutes":)" << result.critical_path_minutes
        << R"(,"estimated_duration_minutes":)" << result.estimated_duration_minutes
        << R"(,"overall_progress":)" << result.overall_progress
        << R"(,"duration_us":)" << result.duration.count()
        << R"(},"completed":)" << json_array(result.completed)
        << R"(,"failed":)" << json_array(result.failed)
        << R"(,"blocked":)" << json_array(result.blocked)
        << R"(,"skipped":)" << json_array(result.skipped)
        << R"(,"results":)" << to_json(result.results)
        << "}";
    return oss.str();
}

}  // namespace workflow_orchestrator
