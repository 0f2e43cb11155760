#include "arena64/Block/Bitmask.hpp"

#include <bitset>
#include <cassert>

namespace arena64 {

// ===================== 构造 =====================

Bitmask::Bitmask() noexcept
    : word_(0)
{}

Bitmask::Bitmask(std::uint64_t initial) noexcept
    : word_(initial)
{}

// ===================== 占用 / 释放 =====================

std::size_t Bitmask::TryClaimFirstFree() noexcept {
    std::uint64_t observed = word_.load(std::memory_order_acquire);

    while (observed != kAllUsed) {
        // 隔离最低位的 0：~w & (w + 1)
        const std::uint64_t lowest_free = ~observed & (observed + 1);

        // 失败时 observed 被更新为最新值，重新计算最低空闲位
        if (word_.compare_exchange_weak(observed, observed | lowest_free,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
            return static_cast<std::size_t>(__builtin_ctzll(lowest_free));
        }
    }

    return kNotFound;
}

void Bitmask::Release(std::size_t bit_index) noexcept {
    assert(bit_index < kBitCount && "Bitmask::Release: index out of range");

    const std::uint64_t bit  = BitOf(bit_index);
    const std::uint64_t prev = word_.fetch_and(~bit, std::memory_order_release);
    (void)prev;
    assert((prev & bit) != 0 && "Bitmask::Release: bit was already clear (double release)");
}

std::uint64_t Bitmask::Toggle(std::size_t bit_index) noexcept {
    assert(bit_index < kBitCount && "Bitmask::Toggle: index out of range");
    return word_.fetch_xor(BitOf(bit_index), std::memory_order_acq_rel);
}

std::uint64_t Bitmask::ToggleAll() noexcept {
    return word_.fetch_xor(kAllUsed, std::memory_order_acq_rel);
}

// ===================== 查询 =====================

bool Bitmask::IsUsed(std::size_t bit_index) const noexcept {
    // 越界视为已占用，与“找不到空闲位”的语义一致
    if (bit_index >= kBitCount) return true;
    return (Load() & BitOf(bit_index)) != 0;
}

bool Bitmask::IsFull() const noexcept {
    return Load() == kAllUsed;
}

bool Bitmask::IsEmpty() const noexcept {
    return Load() == 0;
}

std::size_t Bitmask::CountUsed() const noexcept {
    return std::bitset<kBitCount>(Load()).count();
}

std::uint64_t Bitmask::Load() const noexcept {
    return word_.load(std::memory_order_acquire);
}

} // namespace arena64
