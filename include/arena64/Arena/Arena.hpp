#pragma once

#include <atomic>
#include <cstddef>
#include <utility>

#include "arena64/Arena/Slot.hpp"
#include "arena64/Block/Bitmask.hpp"
#include "arena64/Block/Block.hpp"
#include "arena64/Block/TaggedPtr.hpp"
#include "arena64/Util/Log.hpp"

namespace arena64 {

/**
 * Arena
 * ------------------------------------------------------------
 * 并发可扩展的 Block 集合：Insert 返回一个 Slot，Slot 析构即归还槽位。
 *
 * Block 通过原子 next 指针串成只追加的单链表：
 *   head_ -> B0 -> B1 -> ...
 * 已发布的 Block 不会移动、不会被释放，直到 Arena 析构。
 *
 * 插入时按创建顺序扫描各 Block；全部已满时新建 Block 并 CAS 挂到第一个空链接上。
 * CAS 失败的线程不丢弃自己的 Block，而是继续向后挂到链尾，
 * 然后从赢家的 Block 重新尝试占用。
 */
template <typename T, typename Codec = TagCodec>
class Arena {
public:
    using value_type = T;
    using block_type = Block<T>;
    using slot_type  = Slot<T, Codec>;

    static constexpr std::size_t kSlotsPerBlock = block_type::kSlotCount;

    Arena() noexcept = default;
    ~Arena();

    Arena(const Arena&)            = delete;
    Arena& operator=(const Arena&) = delete;
    Arena(Arena&&)                 = delete;
    Arena& operator=(Arena&&)      = delete;

    // 插入 value，必要时按 64 个槽位一块扩容。
    // 分配 Block 失败时 std::bad_alloc 直接抛给调用方。
    slot_type Insert(T value) {
        return Emplace(std::move(value));
    }

    template <typename... Args>
    slot_type Emplace(Args&&... args) {
        std::size_t index = block_type::kNotFound;
        block_type* block = Claim_(index);
        block->Construct(index, std::forward<Args>(args)...);
        return slot_type(block, index);
    }

    // ---- 统计（仅供诊断，不与并发修改同步）----
    std::size_t GetBlockCount() const noexcept {
        return block_count_.load(std::memory_order_acquire);
    }

    std::size_t GetCapacity() const noexcept {
        return GetBlockCount() * kSlotsPerBlock;
    }

    std::size_t GetLiveCount() const noexcept {
        std::size_t live = 0;
        for (const block_type* b = head_.load(std::memory_order_acquire); b; b = b->GetNext()) {
            live += b->GetLiveCount();
        }
        return live;
    }

    bool IsEmpty() const noexcept { return GetLiveCount() == 0; }

    // 按创建顺序的第 n 个 Block；不存在返回 nullptr
    const block_type* GetBlockAt(std::size_t n) const noexcept {
        const block_type* b = head_.load(std::memory_order_acquire);
        while (b && n > 0) {
            b = b->GetNext();
            --n;
        }
        return b;
    }

private:
    block_type* Claim_(std::size_t& index);
    block_type* AppendBlock_(std::atomic<block_type*>& link);

    std::atomic<block_type*> head_{nullptr};
    std::atomic<std::size_t> block_count_{0};
};

// ===================== 析构 =====================

template <typename T, typename Codec>
Arena<T, Codec>::~Arena() {
    std::size_t leaked = 0;

    block_type* b = head_.load(std::memory_order_acquire);
    while (b) {
        block_type* next = b->GetNext();
        // 正常使用下此处应为 0：所有 Slot 都应先于 Arena 析构
        leaked += b->DestroyLive();
        delete b;
        b = next;
    }

    if (leaked != 0) {
        ARENA64_LOG_WARN("arena %p destroyed with %zu live slot(s); values destroyed",
                         static_cast<void*>(this), leaked);
    }
}

// ===================== 占用 / 扩容 =====================

template <typename T, typename Codec>
typename Arena<T, Codec>::block_type* Arena<T, Codec>::Claim_(std::size_t& index) {
    std::atomic<block_type*>* link = &head_;

    for (;;) {
        block_type* block = link->load(std::memory_order_acquire);
        if (!block) {
            block = AppendBlock_(*link);
        }

        index = block->TryClaimIndex();
        if (index != block_type::kNotFound) {
            return block;
        }

        link = &block->NextLink();
    }
}

template <typename T, typename Codec>
typename Arena<T, Codec>::block_type*
Arena<T, Codec>::AppendBlock_(std::atomic<block_type*>& link) {
    block_type* fresh  = new block_type();
    block_type* winner = nullptr;   // 首个链接上的胜出者（自己胜出时为 nullptr）

    std::atomic<block_type*>* cursor = &link;
    for (;;) {
        block_type* expected = nullptr;
        if (cursor->compare_exchange_strong(expected, fresh,
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
            const std::size_t count = block_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
            if (winner) {
                ARENA64_LOG_DEBUG("arena %p: growth race lost, surplus block %p published as #%zu",
                                  static_cast<void*>(this), static_cast<void*>(fresh), count);
                return winner;
            }
            ARENA64_LOG_DEBUG("arena %p: appended block %p (#%zu)",
                              static_cast<void*>(this), static_cast<void*>(fresh), count);
            return fresh;
        }

        // expected 已被其他线程填上，沿链继续向后挂
        if (!winner) winner = expected;
        cursor = &expected->NextLink();
    }
}

} // namespace arena64
