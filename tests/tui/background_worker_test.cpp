#include "../test_config.h"

#include <atomic>
#include <chrono>
#include <thread>

#include "tui/BackgroundWorker.hpp"

namespace {
// Spins until condition holds or roughly two seconds pass.
template <typename Condition>
bool WaitFor(Condition condition) {
    for (int i = 0; i < 2000; ++i) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return condition();
}
}

TEST(BackgroundWorkerTest, RequestStopReturnsWhileTaskIsStillRunning) {
    BackgroundWorker worker;
    std::atomic<bool> saw_stop{false};
    std::atomic<bool> release{false};

    ASSERT_TRUE(worker.Launch([&](const std::atomic<bool>& stop) {
        // Simulates finishing the file in progress before honoring the stop.
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        saw_stop = stop.load();
    }));

    worker.RequestStop();
    EXPECT_TRUE(worker.Busy());

    release = true;
    EXPECT_TRUE(WaitFor([&] { return !worker.Busy(); }));
    worker.Wait();
    EXPECT_TRUE(saw_stop.load());
}

TEST(BackgroundWorkerTest, RefusesSecondTaskUntilFirstFinishes) {
    BackgroundWorker worker;
    std::atomic<bool> release{false};
    std::atomic<int> runs{0};

    ASSERT_TRUE(worker.Launch([&](const std::atomic<bool>&) {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ++runs;
    }));
    EXPECT_FALSE(worker.Launch([&](const std::atomic<bool>&) { ++runs; }));

    release = true;
    ASSERT_TRUE(WaitFor([&] { return !worker.Busy(); }));

    std::atomic<bool> stop_seen{true};
    ASSERT_TRUE(worker.Launch([&](const std::atomic<bool>& stop) {
        stop_seen = stop.load();
        ++runs;
    }));
    worker.Wait();
    EXPECT_EQ(runs.load(), 2);
    EXPECT_FALSE(stop_seen.load());
}

TEST(BackgroundWorkerTest, DestructorStopsAndJoinsRunningTask) {
    std::atomic<bool> finished{false};
    {
        BackgroundWorker worker;
        ASSERT_TRUE(worker.Launch([&](const std::atomic<bool>& stop) {
            while (!stop.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finished = true;
        }));
    }
    EXPECT_TRUE(finished.load());
}
