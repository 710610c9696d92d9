#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "common/fine_grained_lock.h"

using namespace Wipflow;

TEST(StageLockTest, KeyCombinesFactoryAndStageCode) {
    EXPECT_EQ(StageLock::Key("F1", Stage::kPreAcceptance), "F1/PAP");
    EXPECT_EQ(StageLock::Key("F1", Stage::kPreInspection), "F1/PIP");
    EXPECT_EQ(StageLock::Key("F2", Stage::kPostInspection), "F2/PIPO");
}

TEST(StageLockTest, StripeIndexIsStableAndInRange) {
    StripedStageLock<8> locks;
    const std::string key = StripedStageLock<8>::Key("F1", Stage::kPreInspection);
    size_t index = locks.GetStripeIndex(key);
    EXPECT_LT(index, 8u);
    EXPECT_EQ(index, locks.GetStripeIndex(key));
}

TEST(StageLockTest, GuardSerializesSameKey) {
    StageLock locks;
    int counter = 0;
    constexpr int kThreads = 4;
    constexpr int kIterations = 10000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kIterations; ++i) {
                StageLock::Guard guard(locks, "F1", Stage::kPreAcceptance);
                counter++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(counter, kThreads * kIterations);
}

TEST(StageLockTest, AllGuardExcludesEveryKey) {
    StripedStageLock<4> locks;
    std::atomic<bool> entered{false};
    std::thread worker;
    {
        StripedStageLock<4>::AllGuard all(locks);
        worker = std::thread([&]() {
            StripedStageLock<4>::Guard guard(locks, "F7", Stage::kPostInspection);
            entered = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(entered);
    }
    worker.join();
    EXPECT_TRUE(entered);

    // Released stripes can be taken again
    StripedStageLock<4>::AllGuard again(locks);
}
