/**
 * @file test_event_bus.cpp
 * @brief Unit tests for the asynchronous EventBus.
 */

#include "coordination/event_bus.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace workflow_orchestrator;

class EventBusTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    EventBus bus_{logger_};

    void SetUp() override { bus_.start(); }
    void TearDown() override { bus_.stop(); }
};

/// Thread-safe record of what a subscriber received.
struct Inbox {
    std::mutex mutex;
    std::vector<std::string> ids;

    EventBus::Callback callback() {
        return [this](const Message& m) {
            std::lock_guard lock(mutex);
            ids.push_back(m.id());
        };
    }
    size_t size() {
        std::lock_guard lock(mutex);
        return ids.size();
    }
};

// ─── Delivery ────────────────────────────────

TEST_F(EventBusTest, BroadcastReachesEverySubscriberOfType) {
    Inbox a, b, other;
    bus_.subscribe(MessageType::TaskCompleted, "a", a.callback());
    bus_.subscribe(MessageType::TaskCompleted, "b", b.callback());
    bus_.subscribe(MessageType::TaskFailed, "other", other.callback());

    bus_.publish(MessageType::TaskCompleted, "orchestrator", {{"task_id", "t1"}});
    bus_.wait_idle();

    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(b.size(), 1u);
    EXPECT_EQ(other.size(), 0u);
}

TEST_F(EventBusTest, DirectedMessageReachesOnlyRecipient) {
    Inbox worker_1, worker_2;
    bus_.subscribe(MessageType::TaskAssigned, "worker_1", worker_1.callback());
    bus_.subscribe(MessageType::TaskAssigned, "worker_2", worker_2.callback());

    bus_.publish(MessageType::TaskAssigned, "orchestrator", {{"task_id", "t1"}}, "worker_2");
    bus_.wait_idle();

    EXPECT_EQ(worker_1.size(), 0u);
    EXPECT_EQ(worker_2.size(), 1u);
}

TEST_F(EventBusTest, EmptyRecipientIsBroadcast) {
    Inbox a, b;
    bus_.subscribe(MessageType::SystemEvent, "a", a.callback());
    bus_.subscribe(MessageType::SystemEvent, "b", b.callback());

    auto msg = bus_.publish(MessageType::SystemEvent, "orchestrator", {}, std::string{});
    bus_.wait_idle();

    EXPECT_TRUE(msg.is_broadcast());
    EXPECT_EQ(a.size() + b.size(), 2u);
}

TEST_F(EventBusTest, SubscriberSeesPublishOrder) {
    Inbox inbox;
    bus_.subscribe(MessageType::TaskProgress, "watcher", inbox.callback());

    std::vector<std::string> published;
    for (int i = 0; i < 50; ++i) {
        published.push_back(bus_.publish(MessageType::TaskProgress, "worker",
                                         {{"progress", std::to_string(i)}}).id());
    }
    bus_.wait_idle();

    std::lock_guard lock(inbox.mutex);
    EXPECT_EQ(inbox.ids, published);
}

TEST_F(EventBusTest, ThrowingCallbackDoesNotStopDelivery) {
    Inbox survivor;
    bus_.subscribe(MessageType::TaskFailed, "bad", [](const Message&) {
        throw std::runtime_error("subscriber exploded");
    });
    bus_.subscribe(MessageType::TaskFailed, "good", survivor.callback());

    bus_.publish(MessageType::TaskFailed, "worker", {});
    bus_.publish(MessageType::TaskFailed, "worker", {});
    bus_.wait_idle();

    EXPECT_EQ(survivor.size(), 2u);
    auto stats = bus_.stats();
    EXPECT_EQ(stats.callback_errors, 2u);
    EXPECT_EQ(stats.delivered, 2u);
    EXPECT_EQ(stats.published, 2u);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    Inbox inbox;
    bus_.subscribe(MessageType::TaskStarted, "w", inbox.callback());
    bus_.publish(MessageType::TaskStarted, "orchestrator", {});
    bus_.wait_idle();

    bus_.unsubscribe(MessageType::TaskStarted, "w");
    bus_.publish(MessageType::TaskStarted, "orchestrator", {});
    bus_.wait_idle();

    EXPECT_EQ(inbox.size(), 1u);
}

TEST_F(EventBusTest, MessagesQueuedBeforeStartAreDelivered) {
    EventBus bus(logger_);
    Inbox inbox;
    bus.subscribe(MessageType::SystemEvent, "late", inbox.callback());
    bus.publish(MessageType::SystemEvent, "orchestrator", {{"event", "boot"}});

    EXPECT_FALSE(bus.is_running());
    EXPECT_EQ(bus.stats().queue_size, 1u);

    bus.start();
    bus.wait_idle();
    EXPECT_EQ(inbox.size(), 1u);
    bus.stop();
}

// ─── Messages / History ──────────────────────

TEST_F(EventBusTest, MessageIdsCarrySenderAndSequence) {
    auto first = bus_.publish(MessageType::TaskStarted, "orchestrator", {});
    auto second = bus_.publish(MessageType::TaskStarted, "orchestrator", {});

    EXPECT_EQ(first.id().rfind("orchestrator_", 0), 0u);
    EXPECT_NE(first.id(), second.id());
    EXPECT_EQ(first.sender(), "orchestrator");
}

TEST_F(EventBusTest, PayloadLookup) {
    auto msg = bus_.publish(MessageType::TaskCompleted, "w", {{"task_id", "t9"}});
    EXPECT_EQ(msg.get("task_id"), "t9");
    EXPECT_EQ(msg.get("missing"), "");
}

TEST_F(EventBusTest, HistoryIsBounded) {
    EventBus bus(logger_, 5);
    std::vector<std::string> ids;
    for (int i = 0; i < 8; ++i) {
        ids.push_back(bus.publish(MessageType::SystemEvent, "s", {}).id());
    }

    auto history = bus.history(std::nullopt, std::nullopt, 100);
    ASSERT_EQ(history.size(), 5u);
    EXPECT_EQ(history.front().id(), ids[3]);
    EXPECT_EQ(history.back().id(), ids[7]);
    EXPECT_EQ(bus.stats().history_size, 5u);
}

TEST_F(EventBusTest, HistoryFiltersAndLimits) {
    bus_.publish(MessageType::TaskStarted, "alpha", {});
    bus_.publish(MessageType::TaskCompleted, "alpha", {});
    bus_.publish(MessageType::TaskCompleted, "beta", {});
    bus_.publish(MessageType::TaskCompleted, "alpha", {});

    EXPECT_EQ(bus_.history(MessageType::TaskCompleted).size(), 3u);
    EXPECT_EQ(bus_.history(std::nullopt, std::string{"alpha"}).size(), 3u);
    EXPECT_EQ(bus_.history(MessageType::TaskCompleted, std::string{"alpha"}).size(), 2u);

    // limit keeps the most recent matches
    auto last = bus_.history(std::nullopt, std::nullopt, 1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].sender(), "alpha");
    EXPECT_EQ(last[0].type(), MessageType::TaskCompleted);

    bus_.clear_history();
    EXPECT_TRUE(bus_.history().empty());
}

TEST_F(EventBusTest, ConfiguredDefaultHistoryLimit) {
    EventBus bus(logger_, 100, 3);
    std::vector<std::string> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back(bus.publish(MessageType::SystemEvent, "s", {}).id());
    }

    auto recent = bus.history();
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.front().id(), ids[3]);
    EXPECT_EQ(recent.back().id(), ids[5]);

    // An explicit limit overrides the default
    EXPECT_EQ(bus.history(std::nullopt, std::nullopt, 5).size(), 5u);
    EXPECT_EQ(bus.history(MessageType::SystemEvent).size(), 3u);
}

TEST_F(EventBusTest, HistoryOrderMatchesDeliveryOrderUnderConcurrentPublishers) {
    Inbox inbox;
    bus_.subscribe(MessageType::TaskProgress, "observer", inbox.callback());

    constexpr int kPublishers = 4;
    constexpr int kPerPublisher = 50;
    {
        std::vector<std::jthread> publishers;
        for (int p = 0; p < kPublishers; ++p) {
            publishers.emplace_back([this, p] {
                for (int i = 0; i < kPerPublisher; ++i) {
                    bus_.publish(MessageType::TaskProgress, "worker_" + std::to_string(p), {});
                }
            });
        }
    }
    bus_.wait_idle();

    auto history = bus_.history(MessageType::TaskProgress, std::nullopt, 1000);
    ASSERT_EQ(history.size(), static_cast<size_t>(kPublishers * kPerPublisher));

    std::lock_guard lock(inbox.mutex);
    ASSERT_EQ(inbox.ids.size(), history.size());
    for (size_t i = 0; i < history.size(); ++i) {
        EXPECT_EQ(history[i].id(), inbox.ids[i]) << "position " << i;
    }
}

TEST_F(EventBusTest, MessageJson) {
    auto msg = bus_.publish(MessageType::TaskAssigned, "orch", {{"task_id", "t1"}}, "w1");
    auto json = msg.to_json();
    EXPECT_NE(json.find(R"("type":"task_assigned")"), std::string::npos);
    EXPECT_NE(json.find(R"("recipient":"w1")"), std::string::npos);
    EXPECT_NE(json.find(R"("payload":{"task_id":"t1"})"), std::string::npos);
}

TEST_F(EventBusTest, StopIsIdempotent) {
    bus_.stop();
    bus_.stop();
    EXPECT_FALSE(bus_.is_running());
    bus_.wait_idle();  // returns immediately once stopped
}
