#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

#include "arena64/Block/Bitmask.hpp"
#include "arena64/Block/BlockConfig.hpp"

namespace arena64 {

// 64 个未初始化的槽位存储。Block 与 Bump64 共用同一布局。
template <typename T>
struct BlockCells {
    using Storage = std::aligned_storage_t<sizeof(T), alignof(T)>;

    Storage cells[BlockConfig::kSlotsPerBlock];

    void* Raw(std::size_t index) noexcept {
        assert(index < BlockConfig::kSlotsPerBlock);
        return static_cast<void*>(&cells[index]);
    }

    T* At(std::size_t index) noexcept {
        return reinterpret_cast<T*>(Raw(index));
    }

    const T* At(std::size_t index) const noexcept {
        assert(index < BlockConfig::kSlotsPerBlock);
        return reinterpret_cast<const T*>(&cells[index]);
    }
};

/**
 * Block
 * ------------------------------------------------------------
 * 一个固定容量 64 的槽位数组 + 一个原子占用位图。
 *
 * 约定：
 *   - 创建后地址不再变化（Slot / 标记指针直接保存其地址）；
 *   - 对齐 >= 64，低 6 位用于存放槽位下标；
 *   - bit i 置位  <=>  槽位 i 中有一个已构造的 T，且由唯一的持有者访问；
 *   - 释放时先析构值、再清位，顺序不可颠倒。
 *
 * Block 自身析构时不会析构槽位中的值，由拥有者负责（见 DestroyLive）。
 */
template <typename T>
class alignas(BlockConfig::BlockAlignment<T>()) Block {
public:
    static constexpr std::size_t kSlotCount = BlockConfig::kSlotsPerBlock;
    static constexpr std::size_t kNotFound  = Bitmask::kNotFound;

    Block() noexcept
        : next_(nullptr)
    {
        static_assert(alignof(Block) >= BlockConfig::kMinBlockAlignment,
                      "Block alignment must leave room for the slot index tag");
        static_assert(Bitmask::kBitCount == kSlotCount, "one occupancy bit per slot");
    }
    ~Block() = default;

    Block(const Block&)            = delete;
    Block& operator=(const Block&) = delete;
    Block(Block&&)                 = delete;
    Block& operator=(Block&&)      = delete;

    // ---- 占用 ----

    // 占用最低的空闲槽位，返回下标；已满返回 kNotFound（不是错误）
    std::size_t TryClaimIndex() noexcept {
        return occupancy_.TryClaimFirstFree();
    }

    // 在已占用的槽位上构造值。构造抛异常时先清位再把异常继续抛出。
    template <typename... Args>
    T* Construct(std::size_t index, Args&&... args) {
        assert(occupancy_.IsUsed(index) && "construct into an unclaimed slot");
        try {
            return ::new (cells_.Raw(index)) T(std::forward<Args>(args)...);
        } catch (...) {
            occupancy_.Release(index);
            throw;
        }
    }

    // 占用 + 构造；已满时返回 nullptr
    template <typename... Args>
    T* TryEmplace(std::size_t& out_index, Args&&... args) {
        const std::size_t index = TryClaimIndex();
        if (index == kNotFound) return nullptr;
        T* value = Construct(index, std::forward<Args>(args)...);
        out_index = index;
        return value;
    }

    // ---- 释放 ----

    // 析构值，然后清位
    void Release(std::size_t index) noexcept {
        At(index)->~T();
        occupancy_.Release(index);
    }

    // 取出值，然后清位。移动构造抛异常时槽位保持原样
    T Take(std::size_t index) {
        T* cell = At(index);
        T value(std::move(*cell));
        cell->~T();
        occupancy_.Release(index);
        return value;
    }

    // 只清位，不析构（用于占用后尚未构造、或值已被取走的槽位）
    void ReleaseUninit(std::size_t index) noexcept {
        occupancy_.Release(index);
    }

    // 析构所有仍被占用的槽位中的值并清位，返回析构的个数。
    // 仅在拥有者销毁、没有并发访问时调用。
    std::size_t DestroyLive() noexcept {
        std::size_t destroyed = 0;
        for (std::size_t i = 0; i < kSlotCount; ++i) {
            if (occupancy_.IsUsed(i)) {
                Release(i);
                ++destroyed;
            }
        }
        return destroyed;
    }

    // ---- 访问 ----

    T* At(std::size_t index) noexcept {
        assert(occupancy_.IsUsed(index) && "access to an unoccupied slot");
        return cells_.At(index);
    }

    const T* At(std::size_t index) const noexcept {
        assert(occupancy_.IsUsed(index) && "access to an unoccupied slot");
        return cells_.At(index);
    }

    // 不检查占用位。Boxed64 析构后位图被整体翻转，其 BoxedSlot 经此访问
    T* UncheckedAt(std::size_t index) noexcept {
        return cells_.At(index);
    }

    void* UncheckedRaw(std::size_t index) noexcept {
        return cells_.Raw(index);
    }

    // ---- 查询 ----
    bool          IsFull()    const noexcept { return occupancy_.IsFull(); }
    bool          IsEmpty()   const noexcept { return occupancy_.IsEmpty(); }
    bool          IsUsed(std::size_t index) const noexcept { return occupancy_.IsUsed(index); }
    std::size_t   GetLiveCount() const noexcept { return occupancy_.CountUsed(); }
    std::uint64_t GetOccupancy() const noexcept { return occupancy_.Load(); }

    Bitmask&       GetBitmask() noexcept       { return occupancy_; }
    const Bitmask& GetBitmask() const noexcept { return occupancy_; }

    // ---- Arena 链接 ----
    std::atomic<Block*>& NextLink() noexcept { return next_; }
    Block* GetNext() const noexcept { return next_.load(std::memory_order_acquire); }

private:
    Bitmask             occupancy_;
    std::atomic<Block*> next_;
    BlockCells<T>       cells_;
};

} // namespace arena64
