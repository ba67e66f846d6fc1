/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade: ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Planning a raw task (analysis → decomposition → graph → plan)
 *   2. Executing the plan step by step against registered workers
 *   3. Observing progress, per-task state and aggregated results
 */

#pragma once

#include "analysis/task_analyzer.hpp"
#include "coordination/event_bus.hpp"
#include "coordination/result_aggregator.hpp"
#include "coordination/task_tracker.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/task_runner.hpp"
#include "executor/thread_pool.hpp"
#include "executor/worker.hpp"
#include "scheduler/execution_planner.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/decomposer.hpp"
#include "workload/dependency_mapper.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workflow_orchestrator {

enum class WorkflowState : uint8_t {
    Idle,
    Planning,
    Executing,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(WorkflowState state) noexcept {
    switch (state) {
        case WorkflowState::Idle:      return "idle";
        case WorkflowState::Planning:  return "planning";
        case WorkflowState::Executing: return "executing";
        case WorkflowState::Completed: return "completed";
        case WorkflowState::Failed:    return "failed";
    }
    return "unknown";
}

enum class WorkflowStatus : uint8_t {
    Completed,  ///< Every task completed
    Degraded,   ///< Some tasks completed, others failed, blocked or skipped
    Failed      ///< Nothing completed and at least one task failed
};

[[nodiscard]] constexpr std::string_view to_string(WorkflowStatus status) noexcept {
    switch (status) {
        case WorkflowStatus::Completed: return "completed";
        case WorkflowStatus::Degraded:  return "degraded";
        case WorkflowStatus::Failed:    return "failed";
    }
    return "unknown";
}

/**
 * @brief Everything derived from a description before any worker runs.
 */
struct WorkflowPlan {
    TaskAnalysis analysis;
    Decomposition decomposition;
    DependencyGraph graph;
    ExecutionPlan plan;
};

/**
 * @brief Outcome of one execute_task() call.
 */
struct WorkflowResult {
    WorkflowId workflow_id;
    WorkflowStatus status = WorkflowStatus::Completed;
    size_t total_steps = 0;
    bool can_parallelize = false;
    std::vector<TaskId> critical_path;
    size_t critical_path_length = 0;
    uint32_t critical_path_minutes = 0;
    uint32_t estimated_duration_minutes = 0;
    double overall_progress = 0.0;
    std::vector<TaskId> completed;
    std::vector<TaskId> failed;
    std::vector<TaskId> blocked;
    std::vector<TaskId> skipped;
    WorkflowResults results;
    Duration duration{0};
};

[[nodiscard]] std::string to_json(const WorkflowResult& result);

struct OrchestratorProgress {
    WorkflowState state = WorkflowState::Idle;
    double overall_progress = 0.0;
    TrackerStats task_stats;
    AggregatorStats result_stats;
    BusStats message_stats;
};

/**
 * @brief The top-level Orchestrator that wires all modules together.
 *
 * Owns one EventBus, TaskStateTracker and ResultAggregator. The tracker and
 * aggregator are reset at the start of every run; execute_task() calls are
 * serialized.
 */
class Orchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;
        LogLevel log_level = LogLevel::Info;
    };

    explicit Orchestrator(Options opts);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Workers ──────────────────────────────
    void register_worker(const std::string& domain, std::shared_ptr<IWorker> worker);
    void set_default_worker(std::shared_ptr<IWorker> worker);

    /// Replace the decomposition used for a primary domain. Call before execute_task().
    void register_decomposition_strategy(const std::string& domain,
                                         std::unique_ptr<IDecompositionStrategy> strategy);

    // ── Workflow ─────────────────────────────

    /// Plan without dispatching. Structural problems come back as errors.
    [[nodiscard]] Result<WorkflowPlan> plan_task(std::string_view description);

    Result<WorkflowResult> execute_task(const std::string& description,
                                        const TaskContext& context = {});

    /// Called by a worker while it runs; publishes TaskProgress.
    Result<void> report_progress(const TaskId& task_id, double progress);

    // ── Observation ──────────────────────────
    [[nodiscard]] OrchestratorProgress get_progress() const;
    [[nodiscard]] std::optional<TrackedTask> get_task_status(const TaskId& task_id) const;

    /// Formatted results for the given ids, or for the last run's tasks.
    [[nodiscard]] std::string get_results(OutputFormat format = OutputFormat::Summary,
                                          std::optional<std::vector<TaskId>> task_ids = std::nullopt) const;

    [[nodiscard]] WorkflowState state() const noexcept { return state_.load(); }

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    EventBus& bus() { return bus_; }
    const TaskStateTracker& tracker() const { return tracker_; }
    const ResultAggregator& aggregator() const { return aggregator_; }
    MetricsCollector& metrics() { return metrics_; }

private:
    void register_telemetry();
    void run_step(const ExecutionStep& step,
                  const std::vector<SubTask>& subtasks,
                  const WorkflowId& workflow_id,
                  const TaskContext& context);
    void dispatch(const SubTask& task,
                  const std::shared_ptr<IWorker>& worker,
                  size_t step_number,
                  const WorkflowId& workflow_id,
                  const TaskContext& context);
    void fail_undispatched(const SubTask& task, const std::string& reason);
    void check(const Result<void>& result, std::string_view action);

    Config config_;
    Logger logger_;

    // Planning
    TaskAnalyzer analyzer_;
    TaskDecomposer decomposer_;
    DependencyMapper mapper_;
    ExecutionPlanner planner_;

    // Coordination
    EventBus bus_;
    TaskStateTracker tracker_;
    ResultAggregator aggregator_;

    // Executor
    ThreadPool thread_pool_;
    TaskRunner task_runner_;
    WorkerRegistry workers_;

    // Telemetry
    MetricsCollector metrics_;

    std::atomic<bool> running_{false};
    std::atomic<WorkflowState> state_{WorkflowState::Idle};
    std::atomic<uint64_t> workflow_seq_{0};

    std::mutex run_mutex_;
    mutable std::mutex last_run_mutex_;
    std::vector<TaskId> last_task_ids_;
};

}  // namespace workflow_orchestrator
