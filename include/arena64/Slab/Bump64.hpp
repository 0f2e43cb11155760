#pragma once

#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

#include "arena64/Block/Block.hpp"
#include "arena64/Block/BlockConfig.hpp"

namespace arena64 {

/**
 * Bump64
 * ------------------------------------------------------------
 * 与 Block 相同的 64 槽位布局，但只用一个原子游标顺序分配：
 * 没有位图扫描、没有释放、没有复用，也不交出 Slot。
 * 仅作为“无回收的纯顺序分配”的性能参照。
 *
 * 只接受平凡析构的 T：槽位里的值永远不会被析构。
 * 构造抛异常时该槽位作废（游标已前移）。
 */
template <typename T>
class alignas(BlockConfig::BlockAlignment<T>()) Bump64 {
    static_assert(std::is_trivially_destructible<T>::value,
                  "Bump64 never runs destructors; T must be trivially destructible");

public:
    static constexpr std::size_t kCapacity = BlockConfig::kSlotsPerBlock;

    Bump64() noexcept
        : cursor_(0)
    {}
    ~Bump64() = default;

    Bump64(const Bump64&)            = delete;
    Bump64& operator=(const Bump64&) = delete;
    Bump64(Bump64&&)                 = delete;
    Bump64& operator=(Bump64&&)      = delete;

    // 已用完时返回 nullptr
    template <typename... Args>
    T* TryEmplace(Args&&... args) {
        // 先读一次，用完后不再推进游标
        if (cursor_.load(std::memory_order_relaxed) >= kCapacity) return nullptr;

        const std::size_t idx = cursor_.fetch_add(1, std::memory_order_relaxed);
        if (idx >= kCapacity) return nullptr;

        return ::new (cells_.Raw(idx)) T(std::forward<Args>(args)...);
    }

    T* TryInsert(T value) {
        return TryEmplace(std::move(value));
    }

    std::size_t GetSize() const noexcept {
        const std::size_t n = cursor_.load(std::memory_order_acquire);
        return n < kCapacity ? n : kCapacity;
    }

    bool IsFull() const noexcept { return GetSize() == kCapacity; }

    // 第 i 个已分配的值（i < GetSize()）
    T* At(std::size_t index) noexcept { return cells_.At(index); }

private:
    std::atomic<std::size_t> cursor_;
    BlockCells<T>            cells_;
};

} // namespace arena64
