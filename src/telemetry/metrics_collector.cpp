/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"
#include "core/json.hpp"

#include <chrono>
#include <sstream>

namespace workflow_orchestrator {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_event(const TaskId& id, TaskStatus state, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"task_state_change")"
        << R"(,"ts":)" << json_quote(format_timestamp(std::chrono::system_clock::now()))
        << R"(,"task":)" << json_quote(id)
        << R"(,"state":")" << to_string(state) << "\""
        << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_plan(const WorkflowId& workflow_id, const ExecutionPlan& plan) {
    std::ostringstream oss;
    oss << R"({"event":"plan_created")"
        << R"(,"workflow":)" << json_quote(workflow_id)
        << R"(,"steps":)" << plan.total_steps
        << R"(,"parallel":)" << (plan.can_parallelize ? "true" : "false")
        << R"(,"estimated_minutes":)" << plan.estimated_duration_minutes
        << R"(,"critical_path":)" << json_array(plan.critical_path)
        << R"(,"critical_path_minutes":)" << plan.critical_path_minutes
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_workflow_complete(const WorkflowId& workflow_id,
                                                std::string_view status,
                                                size_t completed,
                                                size_t failed,
                                                size_t blocked,
                                                size_t skipped,
                                                Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"workflow_complete")"
        << R"(,"workflow":)" << json_quote(workflow_id)
        << R"(,"status":)" << json_quote(status)
        << R"(,"completed":)" << completed
        << R"(,"failed":)" << failed
        << R"(,"blocked":)" << blocked
        << R"(,"skipped":)" << skipped
        << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_bus_message(const Message& message) {
    std::ostringstream oss;
    oss << R"({"event":"bus_message")"
        << R"(,"id":)" << json_quote(message.id())
        << R"(,"type":")" << to_string(message.type()) << "\""
        << R"(,"sender":)" << json_quote(message.sender())
        << R"(,"recipient":)"
        << (message.is_broadcast() ? std::string{"null"} : json_quote(*message.recipient()))
        << R"(,"task":)" << json_quote(message.get("task_id"))
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":)" << json_quote(event)
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace workflow_orchestrator
