#include "gtest/gtest.h"
#include "arena64/Block/Bitmask.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

using arena64::Bitmask;

// 测试套件名称: BitmaskTest
// 测试用例名称: StartsEmpty
TEST(BitmaskTest, StartsEmpty) {
    Bitmask mask;

    EXPECT_TRUE(mask.IsEmpty());
    EXPECT_FALSE(mask.IsFull());
    EXPECT_EQ(mask.CountUsed(), 0u);
    EXPECT_EQ(mask.Load(), 0u);
}

TEST(BitmaskTest, ClaimsLowestFreeBitFirst) {
    Bitmask mask;

    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(mask.TryClaimFirstFree(), i);
    }
    EXPECT_EQ(mask.Load(), 0x1Fu);

    // 释放中间的两个，再次占用应按下标从小到大
    mask.Release(2);
    mask.Release(1);
    EXPECT_FALSE(mask.IsUsed(1));
    EXPECT_FALSE(mask.IsUsed(2));

    EXPECT_EQ(mask.TryClaimFirstFree(), 1u);
    EXPECT_EQ(mask.TryClaimFirstFree(), 2u);
    EXPECT_EQ(mask.TryClaimFirstFree(), 5u);
}

TEST(BitmaskTest, ReportsNotFoundWhenFull) {
    Bitmask mask;

    for (std::size_t i = 0; i < Bitmask::kBitCount; ++i) {
        ASSERT_EQ(mask.TryClaimFirstFree(), i);
    }

    EXPECT_TRUE(mask.IsFull());
    EXPECT_EQ(mask.CountUsed(), Bitmask::kBitCount);
    EXPECT_EQ(mask.TryClaimFirstFree(), Bitmask::kNotFound);

    // 最高位释放后可再次占用
    mask.Release(63);
    EXPECT_FALSE(mask.IsFull());
    EXPECT_EQ(mask.TryClaimFirstFree(), 63u);
}

TEST(BitmaskTest, InitialWordIsRespected) {
    Bitmask mask(0xFFu);

    EXPECT_EQ(mask.CountUsed(), 8u);
    EXPECT_TRUE(mask.IsUsed(7));
    EXPECT_FALSE(mask.IsUsed(8));
    EXPECT_EQ(mask.TryClaimFirstFree(), 8u);
}

TEST(BitmaskTest, OutOfRangeIndexReadsAsUsed) {
    Bitmask mask;
    EXPECT_TRUE(mask.IsUsed(64));
    EXPECT_TRUE(mask.IsUsed(1000));
}

TEST(BitmaskTest, ToggleReturnsPreviousWord) {
    Bitmask mask;
    mask.TryClaimFirstFree();  // bit 0

    EXPECT_EQ(mask.Toggle(3), 0x1u);
    EXPECT_EQ(mask.Load(), 0x9u);

    EXPECT_EQ(mask.ToggleAll(), 0x9u);
    EXPECT_EQ(mask.Load(), ~std::uint64_t{0x9});

    EXPECT_EQ(mask.Toggle(0), ~std::uint64_t{0x9});
    EXPECT_EQ(mask.Load(), ~std::uint64_t{0x8});
}

TEST(BitmaskTest, DoubleReleaseIsCaughtInDebugBuilds) {
    Bitmask mask;
    const std::size_t idx = mask.TryClaimFirstFree();
    mask.Release(idx);

    EXPECT_DEBUG_DEATH(mask.Release(idx), "double release");
}

// 多线程同时抢占同一个字：每个下标恰好被一个线程拿到
TEST(BitmaskTest, ConcurrentClaimsNeverHandOutTheSameBit) {
    const std::size_t num_threads = 8;
    Bitmask mask;

    std::mutex mu;
    std::vector<std::size_t> claimed;

    auto worker_task = [&]() {
        std::vector<std::size_t> local;
        for (;;) {
            const std::size_t idx = mask.TryClaimFirstFree();
            if (idx == Bitmask::kNotFound) break;
            local.push_back(idx);
        }
        std::lock_guard<std::mutex> lock(mu);
        claimed.insert(claimed.end(), local.begin(), local.end());
    };

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker_task);
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(claimed.size(), Bitmask::kBitCount);
    std::sort(claimed.begin(), claimed.end());
    for (std::size_t i = 0; i < Bitmask::kBitCount; ++i) {
        EXPECT_EQ(claimed[i], i);
    }
    EXPECT_TRUE(mask.IsFull());
}
