#include "gtest/gtest.h"
#include "arena64/Arena/Arena.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

using arena64::Arena;
using arena64::Slot;

namespace {

struct CountsDestruction {
    static int destroyed;
    int value;
    explicit CountsDestruction(int v) : value(v) {}
    ~CountsDestruction() { ++destroyed; }
};
int CountsDestruction::destroyed = 0;

struct MaybeThrows {
    explicit MaybeThrows(bool fail) {
        if (fail) throw std::runtime_error("boom");
    }
};

// 既不能复制也不能移动，只能原地构造
struct Pinned {
    explicit Pinned(int v) : value(v) {}
    Pinned(const Pinned&) = delete;
    Pinned& operator=(const Pinned&) = delete;
    int value;
};

} // namespace

TEST(ArenaTest, EmptyArenaHasNoBlocks) {
    Arena<std::uint64_t> arena;

    EXPECT_EQ(arena.GetBlockCount(), 0u);
    EXPECT_EQ(arena.GetCapacity(), 0u);
    EXPECT_EQ(arena.GetLiveCount(), 0u);
    EXPECT_TRUE(arena.IsEmpty());
    EXPECT_EQ(arena.GetBlockAt(0), nullptr);
}

// 65 次插入：前 64 个落在 Block 0 的 0..63，第 65 个新建 Block 1 的下标 0；
// 释放 Block 0 下标 0 后再插入，应复用该位置而不是新建 Block
TEST(ArenaTest, SixtyFifthInsertGrowsAndReleasedSlotIsReused) {
    Arena<std::uint64_t> arena;
    std::vector<Slot<std::uint64_t>> slots;

    for (std::uint64_t i = 0; i < 65; ++i) {
        slots.push_back(arena.Insert(i));
    }

    const auto* block0 = arena.GetBlockAt(0);
    const auto* block1 = arena.GetBlockAt(1);
    ASSERT_NE(block0, nullptr);
    ASSERT_NE(block1, nullptr);
    EXPECT_EQ(arena.GetBlockCount(), 2u);

    for (std::size_t i = 0; i < 64; ++i) {
        EXPECT_EQ(slots[i].GetBlock(), block0);
        EXPECT_EQ(slots[i].GetIndex(), i);
        EXPECT_EQ(*slots[i], i);
    }
    EXPECT_EQ(slots[64].GetBlock(), block1);
    EXPECT_EQ(slots[64].GetIndex(), 0u);
    EXPECT_EQ(*slots[64], 64u);

    slots[0].Reset();
    EXPECT_EQ(arena.GetLiveCount(), 64u);

    auto again = arena.Insert(1000);
    EXPECT_EQ(again.GetBlock(), block0);
    EXPECT_EQ(again.GetIndex(), 0u);
    EXPECT_EQ(*again, 1000u);
    EXPECT_EQ(arena.GetBlockCount(), 2u);
}

TEST(ArenaTest, ClaimsLowestFreeIndexAcrossBlocks) {
    Arena<int> arena;
    std::vector<Slot<int>> slots;
    for (int i = 0; i < 128; ++i) slots.push_back(arena.Insert(i));

    // 释放 Block 1 的 5 与 Block 0 的 40、7
    slots[64 + 5].Reset();
    slots[40].Reset();
    slots[7].Reset();

    auto a = arena.Insert(-1);
    auto b = arena.Insert(-2);
    auto c = arena.Insert(-3);

    EXPECT_EQ(a.GetBlock(), arena.GetBlockAt(0));
    EXPECT_EQ(a.GetIndex(), 7u);
    EXPECT_EQ(b.GetBlock(), arena.GetBlockAt(0));
    EXPECT_EQ(b.GetIndex(), 40u);
    EXPECT_EQ(c.GetBlock(), arena.GetBlockAt(1));
    EXPECT_EQ(c.GetIndex(), 5u);
    EXPECT_EQ(arena.GetBlockCount(), 2u);
}

TEST(ArenaTest, CapacityGrowsInBlocksOfSixtyFour) {
    Arena<std::uint32_t> arena;

    std::vector<Slot<std::uint32_t>> slots;
    for (std::uint32_t i = 0; i < 512; ++i) slots.push_back(arena.Insert(i));

    EXPECT_EQ(arena.GetBlockCount(), 8u);
    EXPECT_EQ(arena.GetCapacity(), 512u);
    EXPECT_EQ(arena.GetLiveCount(), 512u);

    std::vector<std::uint32_t> values;
    for (auto& s : slots) values.push_back(s.Take());
    for (std::uint32_t i = 0; i < 512; ++i) EXPECT_EQ(values[i], i);

    EXPECT_TRUE(arena.IsEmpty());
    EXPECT_EQ(arena.GetBlockCount(), 8u);  // Block 不回收
}

// 早期插入得到的地址在后续大量扩容后仍然有效
TEST(ArenaTest, EarlyBlocksNeverMove) {
    Arena<std::uint64_t> arena;

    auto first = arena.Insert(0xABCDu);
    const std::uint64_t* first_addr = first.Get();
    const auto* first_block = arena.GetBlockAt(0);

    std::vector<Slot<std::uint64_t>> more;
    for (std::uint64_t i = 0; i < 64 * 50; ++i) more.push_back(arena.Insert(i));

    EXPECT_GE(arena.GetBlockCount(), 50u);
    EXPECT_EQ(arena.GetBlockAt(0), first_block);
    EXPECT_EQ(first.Get(), first_addr);
    EXPECT_EQ(*first, 0xABCDu);
}

TEST(ArenaTest, EmplaceConstructsInPlace) {
    Arena<Pinned> arena;
    auto p = arena.Emplace(17);
    EXPECT_EQ(p->value, 17);
}

TEST(ArenaTest, HoldsMoveOnlyValues) {
    Arena<std::unique_ptr<int>> arena;
    auto s = arena.Insert(std::make_unique<int>(5));
    EXPECT_EQ(**s, 5);

    std::unique_ptr<int> out = s.Take();
    EXPECT_EQ(*out, 5);
    EXPECT_TRUE(arena.IsEmpty());
}

TEST(ArenaTest, ConstructorExceptionPropagatesAndFreesTheSlot) {
    Arena<MaybeThrows> arena;

    EXPECT_THROW(arena.Emplace(true), std::runtime_error);
    EXPECT_EQ(arena.GetLiveCount(), 0u);

    auto ok = arena.Emplace(false);
    EXPECT_EQ(ok.GetIndex(), 0u);
}

TEST(ArenaTest, DroppingSlotsRunsDestructors) {
    CountsDestruction::destroyed = 0;
    Arena<CountsDestruction> arena;
    {
        auto a = arena.Emplace(1);
        auto b = arena.Emplace(2);
        EXPECT_EQ(CountsDestruction::destroyed, 0);
    }
    EXPECT_EQ(CountsDestruction::destroyed, 2);
    EXPECT_TRUE(arena.IsEmpty());
}

// 未转回的标记指针在 Arena 析构时视为泄漏：值仍会被析构
TEST(ArenaTest, TeardownDestroysCellsStillMarkedOccupied) {
    CountsDestruction::destroyed = 0;
    {
        Arena<CountsDestruction> arena;
        for (int i = 0; i < 70; ++i) {
            void* raw = arena.Emplace(i).IntoRaw();
            (void)raw;
        }
        EXPECT_EQ(arena.GetLiveCount(), 70u);
        EXPECT_EQ(CountsDestruction::destroyed, 0);
    }
    EXPECT_EQ(CountsDestruction::destroyed, 70);
}
