/**
 * @file result_aggregator.cpp
 * @brief ResultAggregator implementation and output formatting.
 */

#include "coordination/result_aggregator.hpp"
#include "core/json.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace workflow_orchestrator {

namespace {

constexpr std::string_view kComponent = "aggregator";

std::string join(const std::set<WorkerId>& items, std::string_view sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::string metadata_json(const Metadata& metadata) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : metadata) {
        if (!first) out += ",";
        first = false;
        out += json_quote(key) + ":" + json_quote(value);
    }
    return out + "}";
}

std::string summary_json(const TaskResultSummary& summary) {
    std::ostringstream oss;
    oss << R"({"task_id":)" << json_quote(summary.task_id)
        << R"(,"status":)" << json_quote(summary.status)
        << R"(,"num_results":)" << summary.num_results()
        << R"(,"workers":)" << json_array({summary.workers.begin(), summary.workers.end()})
        << R"(,"outputs":[)";
    for (size_t i = 0; i < summary.outputs.size(); ++i) {
        const auto& r = summary.outputs[i];
        if (i > 0) oss << ",";
        oss << R"({"worker_id":)" << json_quote(r.worker_id)
            << R"(,"output":)" << json_quote(r.output)
            << R"(,"metadata":)" << metadata_json(r.metadata)
            << R"(,"timestamp":)" << json_quote(format_timestamp(r.timestamp)) << "}";
    }
    oss << "]";
    if (summary.first_result) {
        oss << R"(,"first_result":)" << json_quote(format_timestamp(*summary.first_result))
            << R"(,"last_result":)" << json_quote(format_timestamp(*summary.last_result));
    }
    oss << "}";
    return oss.str();
}

}  // namespace

std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept {
    if (text == "summary")  return OutputFormat::Summary;
    if (text == "detailed") return OutputFormat::Detailed;
    if (text == "json")     return OutputFormat::Json;
    return std::nullopt;
}

ResultAggregator::ResultAggregator(Logger& logger) : logger_(logger) {}

std::string ResultAggregator::add_result(const TaskId& task_id,
                                         const WorkerId& worker_id,
                                         std::string output,
                                         Metadata metadata) {
    std::string result_id;
    {
        std::lock_guard lock(mutex_);
        result_id = task_id + "_" + worker_id + "_" + std::to_string(++sequence_);
        results_.emplace(result_id, ResultRecord{
            .result_id = result_id,
            .task_id = task_id,
            .worker_id = worker_id,
            .output = std::move(output),
            .metadata = std::move(metadata),
            .timestamp = std::chrono::system_clock::now()
        });
        by_task_[task_id].push_back(result_id);
    }
    logger_.debug("Added result " + result_id + " for task " + task_id, kComponent);
    return result_id;
}

std::optional<ResultRecord> ResultAggregator::get_result(const std::string& result_id) const {
    std::lock_guard lock(mutex_);
    auto it = results_.find(result_id);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

std::vector<ResultRecord> ResultAggregator::task_results_locked(const TaskId& task_id) const {
    std::vector<ResultRecord> out;
    auto it = by_task_.find(task_id);
    if (it == by_task_.end()) return out;
    for (const auto& rid : it->second) {
        if (auto r = results_.find(rid); r != results_.end()) {
            out.push_back(r->second);
        }
    }
    return out;
}

std::vector<ResultRecord> ResultAggregator::task_results(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    return task_results_locked(task_id);
}

std::vector<ResultRecord> ResultAggregator::worker_results(const WorkerId& worker_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ResultRecord> out;
    for (const auto& [id, record] : results_) {
        if (record.worker_id == worker_id) out.push_back(record);
    }
    std::sort(out.begin(), out.end(), [](const ResultRecord& a, const ResultRecord& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

TaskResultSummary ResultAggregator::aggregate_task_results(const TaskId& task_id) const {
    TaskResultSummary summary{.task_id = task_id, .status = "no_results"};
    {
        std::lock_guard lock(mutex_);
        summary.outputs = task_results_locked(task_id);
    }
    if (summary.outputs.empty()) return summary;

    std::stable_sort(summary.outputs.begin(), summary.outputs.end(),
        [](const ResultRecord& a, const ResultRecord& b) { return a.timestamp < b.timestamp; });

    summary.status = "completed";
    for (const auto& r : summary.outputs) {
        summary.workers.insert(r.worker_id);
    }
    summary.first_result = summary.outputs.front().timestamp;
    summary.last_result = summary.outputs.back().timestamp;
    return summary;
}

WorkflowResults ResultAggregator::aggregate_workflow_results(const std::vector<TaskId>& task_ids) const {
    WorkflowResults wf;
    wf.total_tasks = task_ids.size();
    wf.task_results.reserve(task_ids.size());
    for (const auto& id : task_ids) {
        auto summary = aggregate_task_results(id);
        wf.total_results += summary.num_results();
        wf.workers.insert(summary.workers.begin(), summary.workers.end());
        wf.task_results.push_back(std::move(summary));
    }
    return wf;
}

std::string ResultAggregator::format_final_output(const std::vector<TaskId>& task_ids,
                                                  OutputFormat format) const {
    auto wf = aggregate_workflow_results(task_ids);

    if (format == OutputFormat::Json) {
        return to_json(wf);
    }

    std::ostringstream oss;
    if (format == OutputFormat::Detailed) {
        const std::string rule(60, '=');
        oss << rule << "\nWORKFLOW RESULTS\n" << rule << "\n"
            << "\nTotal Tasks: " << wf.total_tasks
            << "\nTotal Results: " << wf.total_results
            << "\nWorkers Involved: " << join(wf.workers, ", ")
            << "\n\n" << std::string(60, '-') << "\n";
        for (const auto& task : wf.task_results) {
            oss << "\nTask: " << task.task_id
                << "\nStatus: " << task.status << "\n";
            for (size_t i = 0; i < task.outputs.size(); ++i) {
                oss << "\n  Result " << (i + 1) << " (from " << task.outputs[i].worker_id << "):"
                    << "\n    " << task.outputs[i].output << "\n";
            }
        }
        oss << "\n" << rule;
        return oss.str();
    }

    oss << "Workflow completed with " << wf.total_tasks << " tasks\n"
        << "Total results: " << wf.total_results << "\n"
        << "Workers: " << join(wf.workers, ", ");
    return oss.str();
}

void ResultAggregator::clear_task_results(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    auto it = by_task_.find(task_id);
    if (it == by_task_.end()) return;
    for (const auto& rid : it->second) {
        results_.erase(rid);
    }
    by_task_.erase(it);
    logger_.debug("Cleared results for task " + task_id, kComponent);
}

void ResultAggregator::clear() {
    std::lock_guard lock(mutex_);
    results_.clear();
    by_task_.clear();
}

AggregatorStats ResultAggregator::stats() const {
    std::lock_guard lock(mutex_);
    std::set<WorkerId> workers;
    for (const auto& [id, record] : results_) {
        workers.insert(record.worker_id);
    }
    return AggregatorStats{
        .total_results = results_.size(),
        .unique_tasks = by_task_.size(),
        .unique_workers = workers.size()
    };
}

std::string to_json(const WorkflowResults& results) {
    std::ostringstream oss;
    oss << R"({"workflow":{"total_tasks":)" << results.total_tasks
        << R"(,"total_results":)" << results.total_results
        << R"(,"unique_workers":)" << results.unique_workers()
        << R"(,"workers":)" << json_array({results.workers.begin(), results.workers.end()})
        << R"(},"task_results":{)";
    for (size_t i = 0; i < results.task_results.size(); ++i) {
        if (i > 0) oss << ",";
        oss << json_quote(results.task_results[i].task_id) << ":"
            << summary_json(results.task_results[i]);
    }
    oss << "}}";
    return oss.str();
}

}  // namespace workflow_orchestrator
