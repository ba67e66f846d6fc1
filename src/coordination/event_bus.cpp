/**
 * @file event_bus.cpp
 * @brief EventBus implementation.
 */

#include "coordination/event_bus.hpp"
#include "core/json.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

namespace workflow_orchestrator {

namespace {
constexpr std::string_view kComponent = "bus";
}

std::string Message::to_json() const {
    std::ostringstream oss;
    oss << R"({"id":)" << json_quote(id_)
        << R"(,"type":")" << to_string(type_) << "\""
        << R"(,"sender":)" << json_quote(sender_)
        << R"(,"recipient":)" << (recipient_ ? json_quote(*recipient_) : std::string{"null"})
        << R"(,"payload":{)";
    bool first = true;
    for (const auto& [key, value] : payload_) {
        if (!first) oss << ',';
        first = false;
        oss << json_quote(key) << ':' << json_quote(value);
    }
    oss << R"(},"timestamp":")" << format_timestamp(timestamp_) << "\"}";
    return oss.str();
}

EventBus::EventBus(Logger& logger, size_t history_capacity, size_t default_history_limit)
    : logger_(logger)
    , history_capacity_(history_capacity)
    , default_history_limit_(default_history_limit) {}

EventBus::~EventBus() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void EventBus::start() {
    if (running_.exchange(true)) {
        logger_.warn("Event bus already running", kComponent);
        return;
    }
    worker_ = std::jthread([this](std::stop_token stop) { delivery_loop(stop); });
    logger_.info("Event bus started", kComponent);
}

void EventBus::stop() {
    if (!running_.exchange(false)) return;

    worker_.request_stop();
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    idle_cv_.notify_all();
    logger_.info("Event bus stopped", kComponent);
}

// ─────────────────────────────────────────────
// Publishing
// ─────────────────────────────────────────────

void EventBus::publish(Message message) {
    logger_.debug("Published " + std::string(to_string(message.type()))
                  + " message " + message.id(), kComponent);

    {
        // Lock order: queue_mutex_ before history_mutex_
        std::lock_guard queue_lock(queue_mutex_);
        {
            std::lock_guard history_lock(history_mutex_);
            history_.push_back(message);
            while (history_.size() > history_capacity_) {
                history_.pop_front();
            }
        }
        queue_.push(std::move(message));
    }
    ++published_;
    queue_cv_.notify_one();
}

Message EventBus::publish(MessageType type,
                          const std::string& sender,
                          Metadata payload,
                          std::optional<std::string> recipient) {
    Message message(sender + "_" + std::to_string(sequence_.fetch_add(1)),
                    type,
                    sender,
                    std::move(recipient),
                    std::move(payload),
                    std::chrono::system_clock::now());
    publish(message);
    return message;
}

// ─────────────────────────────────────────────
// Subscriptions
// ─────────────────────────────────────────────

void EventBus::subscribe(MessageType type, const std::string& subscriber_id, Callback callback) {
    {
        std::lock_guard lock(subscribers_mutex_);
        subscribers_[{type, subscriber_id}].push_back(std::move(callback));
    }
    logger_.debug("Subscriber " + subscriber_id + " registered for "
                  + std::string(to_string(type)), kComponent);
}

void EventBus::unsubscribe(MessageType type, const std::string& subscriber_id) {
    {
        std::lock_guard lock(subscribers_mutex_);
        subscribers_.erase({type, subscriber_id});
    }
    logger_.debug("Subscriber " + subscriber_id + " unsubscribed from "
                  + std::string(to_string(type)), kComponent);
}

// ─────────────────────────────────────────────
// Delivery
// ─────────────────────────────────────────────

void EventBus::delivery_loop(std::stop_token stop) {
    while (true) {
        std::optional<Message> next;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); });

            // Already-queued messages are still delivered after a stop request
            if (queue_.empty()) {
                if (stop.stop_requested()) break;
                continue;
            }
            next.emplace(std::move(queue_.front()));
            queue_.pop();
            delivering_ = true;
        }

        deliver(*next);

        {
            std::lock_guard lock(queue_mutex_);
            delivering_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void EventBus::deliver(const Message& message) {
    // Snapshot matching callbacks so subscribers may (un)subscribe from inside a callback
    std::vector<std::pair<std::string, Callback>> targets;
    {
        std::lock_guard lock(subscribers_mutex_);
        for (const auto& [key, callbacks] : subscribers_) {
            const auto& [type, subscriber_id] = key;
            if (type != message.type()) continue;
            if (!message.is_broadcast() && *message.recipient() != subscriber_id) continue;
            for (const auto& cb : callbacks) {
                targets.emplace_back(subscriber_id, cb);
            }
        }
    }

    size_t count = 0;
    for (const auto& [subscriber_id, callback] : targets) {
        try {
            callback(message);
            ++count;
        } catch (const std::exception& e) {
            ++callback_errors_;
            logger_.error("Error in subscriber callback " + subscriber_id + ": " + e.what(),
                          kComponent);
        } catch (...) {
            ++callback_errors_;
            logger_.error("Non-standard exception in subscriber callback " + subscriber_id,
                          kComponent);
        }
    }
    delivered_ += count;

    logger_.debug("Delivered message " + message.id() + " to "
                  + std::to_string(count) + " subscribers", kComponent);
}

void EventBus::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return !running_.load() || (queue_.empty() && !delivering_);
    });
}

// ─────────────────────────────────────────────
// History / Stats
// ─────────────────────────────────────────────

std::vector<Message> EventBus::history(std::optional<MessageType> type,
                                       std::optional<std::string> sender,
                                       std::optional<size_t> limit) const {
    const size_t max_results = limit.value_or(default_history_limit_);
    std::vector<Message> matches;
    {
        std::lock_guard lock(history_mutex_);
        for (const auto& msg : history_) {
            if (type && msg.type() != *type) continue;
            if (sender && msg.sender() != *sender) continue;
            matches.push_back(msg);
        }
    }

    if (matches.size() > max_results) {
        matches.erase(matches.begin(),
                      matches.begin() + static_cast<std::ptrdiff_t>(matches.size() - max_results));
    }
    return matches;
}

void EventBus::clear_history() {
    {
        std::lock_guard lock(history_mutex_);
        history_.clear();
    }
    logger_.info("Message history cleared", kComponent);
}

BusStats EventBus::stats() const {
    BusStats s;
    s.running = running_.load();
    {
        std::lock_guard lock(queue_mutex_);
        s.queue_size = queue_.size();
    }
    {
        std::lock_guard lock(history_mutex_);
        s.history_size = history_.size();
    }
    {
        std::lock_guard lock(subscribers_mutex_);
        s.subscribers = subscribers_.size();
    }
    s.published = published_.load();
    s.delivered = delivered_.load();
    s.callback_errors = callback_errors_.load();
    return s;
}

}  // namespace workflow_orchestrator
