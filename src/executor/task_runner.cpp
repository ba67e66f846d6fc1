/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation.
 */

#include "executor/task_runner.hpp"

#include <chrono>
#include <exception>

namespace workflow_orchestrator {

ExecutionResult TaskRunner::execute(const SubTask& task,
                                    IWorker& worker,
                                    const TaskContext& context,
                                    std::stop_token stop) {
    ExecutionResult result{.task_id = task.id, .worker_id = worker.id()};

    if (stop.stop_requested()) {
        result.error_message = "Cancelled via stop token";
        result.worker_result = WorkerResult::error(*result.error_message);
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    try {
        result.worker_result = worker.execute(task.description, context);
    } catch (const std::exception& e) {
        result.worker_result = WorkerResult::error(e.what());
    } catch (...) {
        result.worker_result = WorkerResult::error("Worker threw a non-standard exception");
    }
    result.actual_duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);

    switch (result.worker_result.outcome) {
        case WorkerOutcome::Completed:
            result.final_state = TaskStatus::Completed;
            break;
        case WorkerOutcome::ClarificationNeeded:
            result.final_state = TaskStatus::Blocked;
            break;
        case WorkerOutcome::Error:
            result.final_state = TaskStatus::Failed;
            result.error_message = result.worker_result.message.empty()
                ? std::string{"Worker reported an error"}
                : result.worker_result.message;
            break;
    }
    return result;
}

}  // namespace workflow_orchestrator
