/**
 * @file worker.cpp
 * @brief WorkerRegistry implementation.
 */

#include "executor/worker.hpp"

#include <algorithm>

namespace workflow_orchestrator {

void WorkerRegistry::register_worker(const std::string& domain, std::shared_ptr<IWorker> worker) {
    std::lock_guard lock(mutex_);
    by_domain_[domain] = std::move(worker);
}

void WorkerRegistry::set_default(std::shared_ptr<IWorker> worker) {
    std::lock_guard lock(mutex_);
    default_ = std::move(worker);
}

std::shared_ptr<IWorker> WorkerRegistry::select(const std::string& domain) const {
    std::lock_guard lock(mutex_);
    if (auto it = by_domain_.find(domain); it != by_domain_.end() && it->second) {
        return it->second;
    }
    return default_;
}

std::vector<std::string> WorkerRegistry::domains() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(by_domain_.size());
    for (const auto& [domain, worker] : by_domain_) {
        out.push_back(domain);
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool WorkerRegistry::has_default() const {
    std::lock_guard lock(mutex_);
    return default_ != nullptr;
}

}  // namespace workflow_orchestrator
