/**
 * @file test_task_tracker.cpp
 * @brief Unit tests for TrackedTask transitions and TaskStateTracker.
 */

#include "coordination/task_tracker.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace workflow_orchestrator;

namespace {

SubTask node(std::string id, std::vector<TaskId> deps = {}) {
    SubTask t;
    t.id = std::move(id);
    t.description = "Task " + t.id;
    t.dependencies = std::move(deps);
    return t;
}

}  // namespace

// ─── TrackedTask ─────────────────────────────

TEST(TrackedTaskTest, HappyPath) {
    TrackedTask task(node("t1"));
    EXPECT_EQ(task.status(), TaskStatus::Pending);

    ASSERT_TRUE(task.assign("w1"));
    EXPECT_EQ(task.status(), TaskStatus::Assigned);
    EXPECT_EQ(task.worker_id(), std::optional<WorkerId>{"w1"});
    EXPECT_TRUE(task.assigned_at().has_value());

    ASSERT_TRUE(task.start());
    EXPECT_TRUE(task.started_at().has_value());
    ASSERT_TRUE(task.update_progress(0.4));
    EXPECT_DOUBLE_EQ(task.progress(), 0.4);

    ASSERT_TRUE(task.complete("done"));
    EXPECT_EQ(task.status(), TaskStatus::Completed);
    EXPECT_EQ(task.result(), std::optional<std::string>{"done"});
    EXPECT_DOUBLE_EQ(task.progress(), 1.0);
    EXPECT_TRUE(task.completed_at().has_value());
}

TEST(TrackedTaskTest, CompletedTaskCannotRestart) {
    TrackedTask task(node("t1"));
    ASSERT_TRUE(task.assign("w1"));
    ASSERT_TRUE(task.start());
    ASSERT_TRUE(task.complete("done"));

    auto r = task.start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(r.error().message, "Task t1: illegal transition completed -> in_progress");
    EXPECT_EQ(task.status(), TaskStatus::Completed);

    EXPECT_FALSE(task.fail("late"));
    EXPECT_FALSE(task.assign("w2"));
    EXPECT_EQ(task.worker_id(), std::optional<WorkerId>{"w1"});
}

TEST(TrackedTaskTest, CannotSkipAssignment) {
    TrackedTask task(node("t1"));
    EXPECT_FALSE(task.start());
    EXPECT_FALSE(task.complete("x"));
    EXPECT_FALSE(task.block({}));
    EXPECT_EQ(task.status(), TaskStatus::Pending);
}

TEST(TrackedTaskTest, FailAllowedBeforeStart) {
    TrackedTask pending(node("p"));
    EXPECT_TRUE(pending.fail("no worker"));
    EXPECT_EQ(pending.status(), TaskStatus::Failed);
    EXPECT_EQ(pending.error(), std::optional<std::string>{"no worker"});

    TrackedTask assigned(node("a"));
    ASSERT_TRUE(assigned.assign("w"));
    EXPECT_TRUE(assigned.fail("dispatch failed"));
}

TEST(TrackedTaskTest, BlockIsTerminal) {
    TrackedTask task(node("t2"));
    ASSERT_TRUE(task.assign("w"));
    ASSERT_TRUE(task.start());
    ASSERT_TRUE(task.block({"Which database?"}));

    EXPECT_EQ(task.status(), TaskStatus::Blocked);
    ASSERT_EQ(task.questions().size(), 1u);
    EXPECT_TRUE(is_terminal(task.status()));
    EXPECT_FALSE(task.complete("answer"));
    EXPECT_FALSE(task.start());
}

TEST(TrackedTaskTest, ProgressOnlyWhileRunningAndClamped) {
    TrackedTask task(node("t"));
    EXPECT_FALSE(task.update_progress(0.5));

    ASSERT_TRUE(task.assign("w"));
    ASSERT_TRUE(task.start());
    ASSERT_TRUE(task.update_progress(1.7));
    EXPECT_DOUBLE_EQ(task.progress(), 1.0);
    ASSERT_TRUE(task.update_progress(-3.0));
    EXPECT_DOUBLE_EQ(task.progress(), 0.0);
}

TEST(TrackedTaskTest, NonFiniteProgressIsRejected) {
    TrackedTask task(node("t"));
    ASSERT_TRUE(task.assign("w"));
    ASSERT_TRUE(task.start());
    ASSERT_TRUE(task.update_progress(0.25));

    for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity()}) {
        auto r = task.update_progress(bad);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::InvalidTransition);
        EXPECT_DOUBLE_EQ(task.progress(), 0.25);
    }
    EXPECT_EQ(task.to_json().find("nan"), std::string::npos);
}

TEST(TrackedTaskTest, JsonView) {
    TrackedTask task(node("t1", {"t0"}));
    auto json = task.to_json();
    EXPECT_NE(json.find(R"("task_id":"t1")"), std::string::npos);
    EXPECT_NE(json.find(R"("status":"pending")"), std::string::npos);
    EXPECT_NE(json.find(R"("worker_id":null)"), std::string::npos);
    EXPECT_NE(json.find(R"("dependencies":["t0"])"), std::string::npos);
}

// ─── TaskStateTracker ────────────────────────

class TaskStateTrackerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    TaskStateTracker tracker_{logger_};

    void add_diamond() {
        ASSERT_TRUE(tracker_.add_task(node("t1")));
        ASSERT_TRUE(tracker_.add_task(node("t2", {"t1"})));
        ASSERT_TRUE(tracker_.add_task(node("t3", {"t1"})));
        ASSERT_TRUE(tracker_.add_task(node("t4", {"t2", "t3"})));
    }

    void run_to_completion(const TaskId& id) {
        ASSERT_TRUE(tracker_.assign(id, "w"));
        ASSERT_TRUE(tracker_.start(id));
        ASSERT_TRUE(tracker_.complete(id, "ok"));
    }

    std::vector<TaskId> ready_ids() {
        std::vector<TaskId> ids;
        for (const auto& t : tracker_.get_ready_tasks()) ids.push_back(t.id());
        return ids;
    }
};

TEST_F(TaskStateTrackerTest, DuplicateAddIsRejected) {
    ASSERT_TRUE(tracker_.add_task(node("t1")));
    auto r = tracker_.add_task(node("t1"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DuplicateTaskId);
    EXPECT_EQ(tracker_.size(), 1u);
}

TEST_F(TaskStateTrackerTest, UnknownTaskIsNotFound) {
    auto r = tracker_.assign("ghost", "w");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TaskNotFound);
    EXPECT_FALSE(tracker_.get_task("ghost").has_value());
    EXPECT_FALSE(tracker_.is_ready("ghost"));
}

TEST_F(TaskStateTrackerTest, ReadinessFollowsCompletion) {
    add_diamond();
    EXPECT_EQ(ready_ids(), std::vector<TaskId>{"t1"});

    run_to_completion("t1");
    EXPECT_EQ(ready_ids(), (std::vector<TaskId>{"t2", "t3"}));

    run_to_completion("t2");
    EXPECT_EQ(ready_ids(), std::vector<TaskId>{"t3"});
    EXPECT_FALSE(tracker_.is_ready("t4"));

    run_to_completion("t3");
    EXPECT_TRUE(tracker_.is_ready("t4"));
}

TEST_F(TaskStateTrackerTest, InProgressTaskIsNotReady) {
    add_diamond();
    ASSERT_TRUE(tracker_.assign("t1", "w"));
    EXPECT_TRUE(ready_ids().empty());
}

TEST_F(TaskStateTrackerTest, BlockedDependencyKeepsDependentsWaiting) {
    add_diamond();
    run_to_completion("t1");
    ASSERT_TRUE(tracker_.assign("t2", "w"));
    ASSERT_TRUE(tracker_.start("t2"));
    ASSERT_TRUE(tracker_.block("t2", {"Need input"}));
    run_to_completion("t3");

    EXPECT_FALSE(tracker_.is_ready("t4"));
    EXPECT_TRUE(ready_ids().empty());
    EXPECT_EQ(tracker_.get_task("t2")->status(), TaskStatus::Blocked);
}

TEST_F(TaskStateTrackerTest, FailedDependencyKeepsDependentsWaiting) {
    add_diamond();
    ASSERT_TRUE(tracker_.fail("t1", "boom"));
    EXPECT_TRUE(ready_ids().empty());
    EXPECT_EQ(tracker_.get_task("t1")->error(), std::optional<std::string>{"boom"});
}

TEST_F(TaskStateTrackerTest, IllegalTransitionLeavesStateUnchanged) {
    add_diamond();
    run_to_completion("t1");
    auto r = tracker_.start("t1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(tracker_.get_task("t1")->status(), TaskStatus::Completed);
}

TEST_F(TaskStateTrackerTest, NaNProgressKeepsOverallProgressFinite) {
    ASSERT_TRUE(tracker_.add_task(node("t1")));
    ASSERT_TRUE(tracker_.assign("t1", "w"));
    ASSERT_TRUE(tracker_.start("t1"));

    EXPECT_FALSE(tracker_.update_progress("t1", std::numeric_limits<double>::quiet_NaN()));
    EXPECT_DOUBLE_EQ(tracker_.get_task("t1")->progress(), 0.0);
    EXPECT_TRUE(std::isfinite(tracker_.get_overall_progress()));
    EXPECT_TRUE(std::isfinite(tracker_.stats().overall_progress));
}

TEST_F(TaskStateTrackerTest, StatsAndProgress) {
    add_diamond();
    EXPECT_DOUBLE_EQ(tracker_.get_overall_progress(), 0.0);

    run_to_completion("t1");
    ASSERT_TRUE(tracker_.assign("t2", "w2"));
    ASSERT_TRUE(tracker_.start("t2"));
    ASSERT_TRUE(tracker_.update_progress("t2", 0.5));

    auto stats = tracker_.stats();
    EXPECT_EQ(stats.total_tasks, 4u);
    EXPECT_EQ(stats.status_counts.at(TaskStatus::Completed), 1u);
    EXPECT_EQ(stats.status_counts.at(TaskStatus::InProgress), 1u);
    EXPECT_EQ(stats.status_counts.at(TaskStatus::Pending), 2u);
    EXPECT_EQ(stats.status_counts.at(TaskStatus::Blocked), 0u);
    EXPECT_EQ(stats.ready_tasks, 1u);
    EXPECT_DOUBLE_EQ(stats.overall_progress, (1.0 + 0.5) / 4.0);
}

TEST_F(TaskStateTrackerTest, QueriesByStatusAndWorker) {
    add_diamond();
    run_to_completion("t1");
    ASSERT_TRUE(tracker_.assign("t3", "special"));

    EXPECT_EQ(tracker_.tasks_by_status(TaskStatus::Pending).size(), 2u);
    ASSERT_EQ(tracker_.tasks_by_worker("special").size(), 1u);
    EXPECT_EQ(tracker_.tasks_by_worker("special")[0].id(), "t3");
    EXPECT_EQ(tracker_.task_ids(), (std::vector<TaskId>{"t1", "t2", "t3", "t4"}));
}

TEST_F(TaskStateTrackerTest, ClearResets) {
    add_diamond();
    tracker_.clear();
    EXPECT_EQ(tracker_.size(), 0u);
    EXPECT_TRUE(tracker_.all_tasks().empty());
    EXPECT_DOUBLE_EQ(tracker_.get_overall_progress(), 0.0);
}

TEST_F(TaskStateTrackerTest, ConcurrentWorkersDoNotRace) {
    constexpr int kTasks = 64;
    for (int i = 0; i < kTasks; ++i) {
        ASSERT_TRUE(tracker_.add_task(node("task_" + std::to_string(i))));
    }

    std::vector<std::jthread> threads;
    for (int i = 0; i < kTasks; ++i) {
        threads.emplace_back([this, i] {
            auto id = "task_" + std::to_string(i);
            EXPECT_TRUE(tracker_.assign(id, "w" + std::to_string(i % 4)));
            EXPECT_TRUE(tracker_.start(id));
            EXPECT_TRUE(tracker_.update_progress(id, 0.5));
            EXPECT_TRUE(tracker_.complete(id, "ok"));
        });
    }
    threads.clear();

    EXPECT_EQ(tracker_.tasks_by_status(TaskStatus::Completed).size(),
              static_cast<size_t>(kTasks));
    EXPECT_DOUBLE_EQ(tracker_.get_overall_progress(), 1.0);
}
