/**
 * @file message.hpp
 * @brief Immutable event message exchanged over the EventBus.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace workflow_orchestrator {

enum class MessageType : uint8_t {
    TaskAssigned,
    TaskStarted,
    TaskProgress,
    TaskCompleted,
    TaskFailed,
    AgentRequest,       ///< Reserved for collaborators
    AgentResponse,      ///< Reserved for collaborators
    SystemEvent
};

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::TaskAssigned:  return "task_assigned";
        case MessageType::TaskStarted:   return "task_started";
        case MessageType::TaskProgress:  return "task_progress";
        case MessageType::TaskCompleted: return "task_completed";
        case MessageType::TaskFailed:    return "task_failed";
        case MessageType::AgentRequest:  return "agent_request";
        case MessageType::AgentResponse: return "agent_response";
        case MessageType::SystemEvent:   return "system_event";
    }
    return "unknown";
}

/**
 * @brief A published event. Fields are fixed at construction.
 *
 * An absent recipient means broadcast to every subscriber of the type.
 */
class Message {
public:
    Message(std::string id,
            MessageType type,
            std::string sender,
            std::optional<std::string> recipient,
            Metadata payload,
            Timestamp timestamp)
        : id_(std::move(id))
        , type_(type)
        , sender_(std::move(sender))
        , recipient_(std::move(recipient))
        , payload_(std::move(payload))
        , timestamp_(timestamp) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] MessageType type() const noexcept { return type_; }
    [[nodiscard]] const std::string& sender() const noexcept { return sender_; }
    [[nodiscard]] const std::optional<std::string>& recipient() const noexcept { return recipient_; }
    [[nodiscard]] const Metadata& payload() const noexcept { return payload_; }
    [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }

    [[nodiscard]] bool is_broadcast() const noexcept {
        return !recipient_.has_value() || recipient_->empty();
    }

    /// Payload lookup; empty string if the key is absent.
    [[nodiscard]] std::string get(const std::string& key) const {
        auto it = payload_.find(key);
        return it == payload_.end() ? std::string{} : it->second;
    }

    [[nodiscard]] std::string to_json() const;

private:
    std::string id_;
    MessageType type_;
    std::string sender_;
    std::optional<std::string> recipient_;
    Metadata payload_;
    Timestamp timestamp_;
};

}  // namespace workflow_orchestrator
