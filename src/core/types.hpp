/**
 * @file types.hpp
 * @brief Fundamental types used throughout WorkflowOrchestrator.
 *
 * Defines TaskId, Complexity, TaskStatus and other shared vocabulary types.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace workflow_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using WorkerId = std::string;
using WorkflowId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

/// Free-form key/value data attached to results and messages.
using Metadata = std::map<std::string, std::string>;

/// Caller-supplied context forwarded to workers. The core never interprets it.
using TaskContext = std::unordered_map<std::string, std::string>;

// ─────────────────────────────────────────────
// Complexity Tier
// ─────────────────────────────────────────────

enum class Complexity : uint8_t {
    Simple,     ///< Single-step task, one worker
    Medium,     ///< Multi-step task, sequential execution
    Complex     ///< Multi-worker, parallel execution possible
};

[[nodiscard]] constexpr std::string_view to_string(Complexity complexity) noexcept {
    switch (complexity) {
        case Complexity::Simple:  return "simple";
        case Complexity::Medium:  return "medium";
        case Complexity::Complex: return "complex";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Complexity> parse_complexity(std::string_view text) noexcept {
    if (text == "simple")  return Complexity::Simple;
    if (text == "medium")  return Complexity::Medium;
    if (text == "complex") return Complexity::Complex;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Waiting for dependencies or dispatch
    Assigned,      ///< Bound to a worker
    InProgress,    ///< Worker is executing
    Completed,     ///< Finished successfully
    Failed,        ///< Worker reported an error or threw
    Blocked        ///< Worker needs clarification
};

/**
 * @brief Convert TaskStatus to string representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Assigned:   return "assigned";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
        case TaskStatus::Blocked:    return "blocked";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed
        || status == TaskStatus::Failed
        || status == TaskStatus::Blocked;
}

}  // namespace workflow_orchestrator
