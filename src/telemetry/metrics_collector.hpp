/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "coordination/message.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/execution_planner.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace workflow_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_event(const TaskId& id, TaskStatus state, Duration duration);
    void record_plan(const WorkflowId& workflow_id, const ExecutionPlan& plan);
    void record_workflow_complete(const WorkflowId& workflow_id,
                                  std::string_view status,
                                  size_t completed,
                                  size_t failed,
                                  size_t blocked,
                                  size_t skipped,
                                  Duration duration);
    void record_bus_message(const Message& message);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace workflow_orchestrator
