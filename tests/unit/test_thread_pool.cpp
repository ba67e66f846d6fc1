/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

using namespace workflow_orchestrator;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, DefaultThreadCountIsPositive) {
    ThreadPool pool;
    EXPECT_GE(pool.thread_count(), 1u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(2);
    auto future = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, CancellableSeesStopToken) {
    ThreadPool pool(1);
    auto future = pool.submit_cancellable([](std::stop_token stop) {
        return stop.stop_requested();
    });
    EXPECT_FALSE(future.get());
}

// ─── run_all (step barrier) ──────────────────

TEST(ThreadPoolTest, RunAllKeepsJobOrder) {
    ThreadPool pool(4);
    std::vector<std::function<std::string()>> jobs;
    for (int i = 0; i < 16; ++i) {
        jobs.emplace_back([i] {
            // Later jobs finish first
            std::this_thread::sleep_for(std::chrono::milliseconds(16 - i));
            return "job_" + std::to_string(i);
        });
    }

    auto results = pool.run_all(std::move(jobs));
    ASSERT_EQ(results.size(), 16u);
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(results[static_cast<size_t>(i)], "job_" + std::to_string(i));
    }
}

TEST(ThreadPoolTest, RunAllWaitsForEveryJob) {
    ThreadPool pool(3);
    std::atomic<int> finished{0};
    std::vector<std::function<int()>> jobs;
    for (int i = 0; i < 9; ++i) {
        jobs.emplace_back([&finished, i] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            finished.fetch_add(1);
            return i;
        });
    }

    auto results = pool.run_all(std::move(jobs));
    EXPECT_EQ(finished.load(), 9);
    EXPECT_EQ(results.size(), 9u);
}

TEST(ThreadPoolTest, RunAllRethrowsAfterAllFinish) {
    ThreadPool pool(2);
    std::atomic<int> finished{0};
    std::vector<std::function<int()>> jobs;
    jobs.emplace_back([]() -> int { throw std::runtime_error("first job failed"); });
    for (int i = 0; i < 4; ++i) {
        jobs.emplace_back([&finished] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return finished.fetch_add(1);
        });
    }

    EXPECT_THROW(pool.run_all(std::move(jobs)), std::runtime_error);
    EXPECT_EQ(finished.load(), 4);
}

TEST(ThreadPoolTest, RunAllEmpty) {
    ThreadPool pool(2);
    auto results = pool.run_all(std::vector<std::function<int()>>{});
    EXPECT_TRUE(results.empty());
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            (void)pool.submit([&counter] { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 20);
}
