/**
 * @file result_aggregator.hpp
 * @brief Collects worker outputs and folds them into task and workflow views.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace workflow_orchestrator {

struct ResultRecord {
    std::string result_id;
    TaskId task_id;
    WorkerId worker_id;
    std::string output;
    Metadata metadata;
    Timestamp timestamp;
};

/// All results recorded for one task, oldest first.
struct TaskResultSummary {
    TaskId task_id;
    std::string status;                 ///< "completed" or "no_results"
    std::vector<ResultRecord> outputs;
    std::set<WorkerId> workers;
    std::optional<Timestamp> first_result;
    std::optional<Timestamp> last_result;

    [[nodiscard]] size_t num_results() const noexcept { return outputs.size(); }
};

struct WorkflowResults {
    size_t total_tasks = 0;
    size_t total_results = 0;
    std::set<WorkerId> workers;
    std::vector<TaskResultSummary> task_results;   ///< In requested order

    [[nodiscard]] size_t unique_workers() const noexcept { return workers.size(); }
};

struct AggregatorStats {
    size_t total_results = 0;
    size_t unique_tasks = 0;
    size_t unique_workers = 0;
};

enum class OutputFormat : uint8_t {
    Summary,
    Detailed,
    Json
};

[[nodiscard]] constexpr std::string_view to_string(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Summary:  return "summary";
        case OutputFormat::Detailed: return "detailed";
        case OutputFormat::Json:     return "json";
    }
    return "unknown";
}

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept;

/**
 * @brief Append-safe store of worker results.
 *
 * add_result() may be called concurrently from parallel workers.
 */
class ResultAggregator {
public:
    explicit ResultAggregator(Logger& logger);

    /// Record one output. Returns an id of the form `<task>_<worker>_<seq>`.
    std::string add_result(const TaskId& task_id,
                           const WorkerId& worker_id,
                           std::string output,
                           Metadata metadata = {});

    [[nodiscard]] std::optional<ResultRecord> get_result(const std::string& result_id) const;
    [[nodiscard]] std::vector<ResultRecord> task_results(const TaskId& task_id) const;
    [[nodiscard]] std::vector<ResultRecord> worker_results(const WorkerId& worker_id) const;

    [[nodiscard]] TaskResultSummary aggregate_task_results(const TaskId& task_id) const;
    [[nodiscard]] WorkflowResults aggregate_workflow_results(const std::vector<TaskId>& task_ids) const;

    [[nodiscard]] std::string format_final_output(const std::vector<TaskId>& task_ids,
                                                  OutputFormat format = OutputFormat::Summary) const;

    void clear_task_results(const TaskId& task_id);
    void clear();

    [[nodiscard]] AggregatorStats stats() const;

private:
    std::vector<ResultRecord> task_results_locked(const TaskId& task_id) const;

    Logger& logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ResultRecord> results_;
    std::unordered_map<TaskId, std::vector<std::string>> by_task_;
    uint64_t sequence_ = 0;
};

/// Render aggregated workflow results as a JSON document.
[[nodiscard]] std::string to_json(const WorkflowResults& results);

}  // namespace workflow_orchestrator
