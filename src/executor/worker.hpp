/**
 * @file worker.hpp
 * @brief External worker interface and domain-based worker routing.
 *
 * A worker is the opaque collaborator that actually performs a subtask.
 * The orchestrator only sees the structured WorkerResult it returns.
 */

#pragma once

#include "core/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace workflow_orchestrator {

enum class WorkerOutcome : uint8_t {
    Completed,
    ClarificationNeeded,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(WorkerOutcome outcome) noexcept {
    switch (outcome) {
        case WorkerOutcome::Completed:           return "completed";
        case WorkerOutcome::ClarificationNeeded: return "clarification_needed";
        case WorkerOutcome::Error:               return "error";
    }
    return "unknown";
}

struct WorkerResult {
    WorkerOutcome outcome = WorkerOutcome::Completed;
    std::string output;
    Metadata metadata;
    std::vector<std::string> questions;     ///< Set when clarification is needed
    std::string message;                    ///< Set on error

    static WorkerResult completed(std::string output, Metadata metadata = {}) {
        return WorkerResult{.outcome = WorkerOutcome::Completed,
                            .output = std::move(output),
                            .metadata = std::move(metadata)};
    }

    static WorkerResult clarification(std::vector<std::string> questions) {
        return WorkerResult{.outcome = WorkerOutcome::ClarificationNeeded,
                            .questions = std::move(questions)};
    }

    static WorkerResult error(std::string message) {
        return WorkerResult{.outcome = WorkerOutcome::Error,
                            .message = std::move(message)};
    }
};

// ─────────────────────────────────────────────
// IWorker (Virtual: supplied by the embedding application)
// ─────────────────────────────────────────────

class IWorker {
public:
    virtual ~IWorker() = default;

    [[nodiscard]] virtual const WorkerId& id() const noexcept = 0;

    /// Perform one subtask. May throw; the caller treats a throw as an error result.
    virtual WorkerResult execute(const std::string& description, const TaskContext& context) = 0;
};

/**
 * @brief Adapts a callable into an IWorker.
 */
class FunctionWorker : public IWorker {
public:
    using Fn = std::function<WorkerResult(const std::string&, const TaskContext&)>;

    FunctionWorker(WorkerId id, Fn fn) : id_(std::move(id)), fn_(std::move(fn)) {}

    [[nodiscard]] const WorkerId& id() const noexcept override { return id_; }

    WorkerResult execute(const std::string& description, const TaskContext& context) override {
        return fn_(description, context);
    }

private:
    WorkerId id_;
    Fn fn_;
};

// ─────────────────────────────────────────────
// WorkerRegistry
// ─────────────────────────────────────────────

/**
 * @brief Routes a subtask domain to a worker, falling back to a default.
 */
class WorkerRegistry {
public:
    void register_worker(const std::string& domain, std::shared_ptr<IWorker> worker);
    void set_default(std::shared_ptr<IWorker> worker);

    /// Worker for the domain, else the default, else nullptr.
    [[nodiscard]] std::shared_ptr<IWorker> select(const std::string& domain) const;

    [[nodiscard]] std::vector<std::string> domains() const;
    [[nodiscard]] bool has_default() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IWorker>> by_domain_;
    std::shared_ptr<IWorker> default_;
};

}  // namespace workflow_orchestrator
