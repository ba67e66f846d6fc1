/**
 * @file event_bus.hpp
 * @brief Asynchronous publish/subscribe bus with bounded history.
 *
 * publish() only enqueues. A single std::jthread consumer delivers messages
 * in publish order, so each subscriber sees FIFO order and its callbacks
 * are never invoked concurrently with each other.
 */

#pragma once

#include "coordination/message.hpp"
#include "core/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace workflow_orchestrator {

struct BusStats {
    bool running = false;
    size_t queue_size = 0;
    size_t history_size = 0;
    size_t subscribers = 0;
    uint64_t published = 0;
    uint64_t delivered = 0;
    uint64_t callback_errors = 0;
};

class EventBus {
public:
    using Callback = std::function<void(const Message&)>;

    explicit EventBus(Logger& logger,
                      size_t history_capacity = 1000,
                      size_t default_history_limit = 100);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // ── Lifecycle ────────────────────────────
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Publishing ───────────────────────────

    /// Enqueue a fully formed message and append it to history.
    /// History order matches delivery order.
    void publish(Message message);

    /// Build a message with a fresh `<sender>_<seq>` id and publish it.
    Message publish(MessageType type,
                    const std::string& sender,
                    Metadata payload,
                    std::optional<std::string> recipient = std::nullopt);

    // ── Subscriptions ────────────────────────
    void subscribe(MessageType type, const std::string& subscriber_id, Callback callback);
    void unsubscribe(MessageType type, const std::string& subscriber_id);

    // ── History / introspection ──────────────
    /// Most recent matches, oldest first. Without a limit the configured default applies.
    [[nodiscard]] std::vector<Message> history(std::optional<MessageType> type = std::nullopt,
                                               std::optional<std::string> sender = std::nullopt,
                                               std::optional<size_t> limit = std::nullopt) const;
    void clear_history();

    /// Block until every message published so far has been delivered.
    /// Returns immediately when the bus is not running.
    void wait_idle();

    [[nodiscard]] BusStats stats() const;

private:
    void delivery_loop(std::stop_token stop);
    void deliver(const Message& message);

    Logger& logger_;
    size_t history_capacity_;
    size_t default_history_limit_;

    std::jthread worker_;
    std::atomic<bool> running_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::queue<Message> queue_;
    bool delivering_ = false;

    mutable std::mutex history_mutex_;
    std::deque<Message> history_;

    mutable std::mutex subscribers_mutex_;
    std::map<std::pair<MessageType, std::string>, std::vector<Callback>> subscribers_;

    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> callback_errors_{0};
};

}  // namespace workflow_orchestrator
