/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <set>
#include <stdexcept>

#include "debridarr/logger.hpp"
#include "debridarr/pool.hpp"
#include "test_support.hpp"

using namespace debridarr;
using debridarr::test::eventually;
using ::testing::ElementsAre;

namespace {

class PoolTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setLevel(LogLevel::ERROR); }

    std::vector<JobId> order() {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

    void record(const JobId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.push_back(id);
    }

    std::mutex mutex_;
    std::vector<JobId> order_;
};

TEST_F(PoolTest, AdmitsOldestDetectionFirst) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> blockerRunning{false};
    Pool pool(1, "Test");

    ASSERT_TRUE(pool.start([&](const JobId& id, int) {
        if (id == "blocker") {
            blockerRunning = true;
            released.wait();
            return;
        }
        record(id);
    }));

    const auto t0 = std::chrono::system_clock::now();
    pool.submit("blocker", t0);
    ASSERT_TRUE(eventually([&] { return blockerRunning.load(); }));

    pool.submit("T3", t0 + std::chrono::seconds(3));
    pool.submit("T1", t0 + std::chrono::seconds(1));
    pool.submit("T2", t0 + std::chrono::seconds(2));
    EXPECT_EQ(pool.queueSize(), 3u);

    release.set_value();
    ASSERT_TRUE(eventually([&] { return order().size() == 3; }));
    EXPECT_THAT(order(), ElementsAre("T1", "T2", "T3"));

    pool.stop();
}

TEST_F(PoolTest, EqualTimestampsKeepSubmissionOrder) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> blockerRunning{false};
    Pool pool(1, "Test");

    ASSERT_TRUE(pool.start([&](const JobId& id, int) {
        if (id == "blocker") {
            blockerRunning = true;
            released.wait();
            return;
        }
        record(id);
    }));

    const auto t0 = std::chrono::system_clock::now();
    pool.submit("blocker", t0);
    ASSERT_TRUE(eventually([&] { return blockerRunning.load(); }));
    for (const char* id : {"a", "b", "c"}) {
        pool.submit(id, t0);
    }

    release.set_value();
    ASSERT_TRUE(eventually([&] { return order().size() == 3; }));
    EXPECT_THAT(order(), ElementsAre("a", "b", "c"));
}

TEST_F(PoolTest, RunsJobsOnEveryWorker) {
    std::mutex workersMutex;
    std::set<int> workers;
    std::atomic<int> inFlight{0};
    std::atomic<int> done{0};
    Pool pool(3, "Test");

    ASSERT_TRUE(pool.start([&](const JobId&, int worker) {
        ++inFlight;
        {
            std::lock_guard<std::mutex> lock(workersMutex);
            workers.insert(worker);
        }
        // Hold each slot until all three are busy
        eventually([&] { return inFlight.load() >= 3; }, std::chrono::seconds(2));
        ++done;
    }));

    const auto now = std::chrono::system_clock::now();
    for (int i = 0; i < 3; ++i) {
        pool.submit("job-" + std::to_string(i), now);
    }

    ASSERT_TRUE(eventually([&] { return done.load() == 3; }));
    std::lock_guard<std::mutex> lock(workersMutex);
    EXPECT_EQ(workers.size(), 3u);
    EXPECT_EQ(pool.workerCount(), 3);
}

TEST_F(PoolTest, RejectsWorkAfterStop) {
    std::atomic<int> runs{0};
    Pool pool(1, "Test");
    ASSERT_TRUE(pool.start([&](const JobId&, int) { ++runs; }));
    EXPECT_FALSE(pool.start([](const JobId&, int) {}));

    pool.stop();
    EXPECT_FALSE(pool.isRunning());
    pool.submit("late", std::chrono::system_clock::now());
    EXPECT_EQ(pool.queueSize(), 0u);
    EXPECT_EQ(runs.load(), 0);
}

TEST_F(PoolTest, ProcessorExceptionDoesNotKillWorker) {
    std::atomic<int> runs{0};
    Pool pool(1, "Test");
    ASSERT_TRUE(pool.start([&](const JobId& id, int) {
        ++runs;
        if (id == "bad") {
            throw std::runtime_error("boom");
        }
    }));

    const auto now = std::chrono::system_clock::now();
    pool.submit("bad", now);
    pool.submit("good", now);
    EXPECT_TRUE(eventually([&] { return runs.load() == 2; }));
}

}
