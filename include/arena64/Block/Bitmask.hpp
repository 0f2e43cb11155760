#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace arena64 {

// 64 位原子占用位图：bit i == 1 表示所属 Block 的第 i 个槽位已被占用。
// 所有修改均为单字原子 RMW，不加锁。
class Bitmask {
public:
    static constexpr std::size_t   kBitCount = 64;
    static constexpr std::size_t   kNotFound = static_cast<std::size_t>(-1);
    static constexpr std::uint64_t kAllUsed  = ~std::uint64_t{0};

    Bitmask() noexcept;
    explicit Bitmask(std::uint64_t initial) noexcept;
    ~Bitmask() = default;

    Bitmask(const Bitmask&)            = delete;
    Bitmask& operator=(const Bitmask&) = delete;
    Bitmask(Bitmask&&)                 = delete;
    Bitmask& operator=(Bitmask&&)      = delete;

    // 占用最低位的空闲 bit 并返回其下标；观察到位图已满时返回 kNotFound。
    // CAS 失败（其他线程改动了该字）则用最新值重试。
    std::size_t TryClaimFirstFree() noexcept;

    // 清除 bit_index。调用方必须持有该 bit（由自己先前成功占用）。
    void Release(std::size_t bit_index) noexcept;

    // fetch_xor 原语，返回修改前的字。供 Boxed64 的共享生命周期协议使用。
    std::uint64_t Toggle(std::size_t bit_index) noexcept;
    std::uint64_t ToggleAll() noexcept;

    // ---- 查询（仅为某一时刻的快照）----
    bool          IsUsed(std::size_t bit_index) const noexcept;
    bool          IsFull() const noexcept;
    bool          IsEmpty() const noexcept;
    std::size_t   CountUsed() const noexcept;
    std::uint64_t Load() const noexcept;

    static constexpr std::uint64_t BitOf(std::size_t bit_index) noexcept {
        return std::uint64_t{1} << bit_index;
    }

private:
    std::atomic<std::uint64_t> word_;
};

} // namespace arena64
