/**
 * @file task_runner.hpp
 * @brief Runs one subtask on a worker and normalizes the outcome.
 */

#pragma once

#include "core/types.hpp"
#include "executor/worker.hpp"
#include "workload/subtask.hpp"

#include <optional>
#include <string>
#include <thread>

namespace workflow_orchestrator {

struct ExecutionResult {
    TaskId task_id;
    WorkerId worker_id;
    TaskStatus final_state = TaskStatus::Failed;
    WorkerResult worker_result;
    Duration actual_duration{0};
    std::optional<std::string> error_message;
};

/**
 * @brief Invokes a worker and maps its result onto a terminal TaskStatus.
 *
 * Completed → Completed, ClarificationNeeded → Blocked, Error or a thrown
 * exception → Failed. A stop request observed before dispatch fails the
 * task without calling the worker.
 */
class TaskRunner {
public:
    ExecutionResult execute(const SubTask& task,
                            IWorker& worker,
                            const TaskContext& context,
                            std::stop_token stop = {});
};

}  // namespace workflow_orchestrator
