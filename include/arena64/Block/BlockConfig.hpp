#pragma once

#include <cstddef>
#include <cstdint>

namespace arena64 {

/**
 * BlockConfig
 * ------------------------------------------------------------
 * Block 布局相关的编译期常量。
 *
 * 每个 Block 固定 64 个槽位，槽位下标写入 Block 基址的低 6 位，
 * 因此 Block 的对齐至少为 64 字节。
 */
class BlockConfig {
public:
    // ---- 编译期常量（布局相关）----
    static constexpr std::size_t    kSlotsPerBlock     = 64;                        // 与 64 位占用位图一一对应
    static constexpr std::size_t    kIndexBits         = 6;                         // log2(kSlotsPerBlock)
    static constexpr std::uintptr_t kIndexMask         = (std::uintptr_t{1} << kIndexBits) - 1;
    static constexpr std::size_t    kMinBlockAlignment = std::size_t{1} << kIndexBits;

    static_assert(kSlotsPerBlock == (std::size_t{1} << kIndexBits),
                  "slot index must fit exactly into the tag bits");

    // Block<T> 的实际对齐：max(64, alignof(T))
    template <typename T>
    static constexpr std::size_t BlockAlignment() noexcept {
        return alignof(T) > kMinBlockAlignment ? alignof(T) : kMinBlockAlignment;
    }
};

} // namespace arena64
