#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "arena64/Block/BlockConfig.hpp"

namespace arena64 {

/**
 * 标记指针编解码
 * ------------------------------------------------------------
 * 把 (Block 基址, 槽位下标) 打包成一个指针宽度的值：
 * Block 至少 64 字节对齐，低 6 位恒为 0，下标直接写进这 6 位。
 *
 * 两种后端对外接口一致、结果逐位相同：
 *   - IntegerTagCodec    : 经 uintptr_t 做整数运算
 *   - ProvenanceTagCodec : 只在字节指针上做加减，结果始终由原始 Block 指针派生
 * 通过 ARENA64_STRICT_PROVENANCE 在编译期选择默认后端。
 */

struct IntegerTagCodec {
    static void* Encode(void* base, std::size_t index) noexcept {
        const auto addr = reinterpret_cast<std::uintptr_t>(base);
        assert((addr & BlockConfig::kIndexMask) == 0 && "block base is not 64-byte aligned");
        assert(index < BlockConfig::kSlotsPerBlock);
        return reinterpret_cast<void*>(addr | static_cast<std::uintptr_t>(index));
    }

    static void* Base(void* tagged) noexcept {
        const auto addr = reinterpret_cast<std::uintptr_t>(tagged);
        return reinterpret_cast<void*>(addr & ~BlockConfig::kIndexMask);
    }

    static std::size_t Index(const void* tagged) noexcept {
        return static_cast<std::size_t>(reinterpret_cast<std::uintptr_t>(tagged) &
                                        BlockConfig::kIndexMask);
    }
};

struct ProvenanceTagCodec {
    // base 指向的 Block 至少有 64 字节，base + index 始终落在同一对象内
    static void* Encode(void* base, std::size_t index) noexcept {
        assert((reinterpret_cast<std::uintptr_t>(base) & BlockConfig::kIndexMask) == 0 &&
               "block base is not 64-byte aligned");
        assert(index < BlockConfig::kSlotsPerBlock);
        return static_cast<unsigned char*>(base) + index;
    }

    static void* Base(void* tagged) noexcept {
        return static_cast<unsigned char*>(tagged) - Index(tagged);
    }

    // 只读取地址位，不据此重建指针
    static std::size_t Index(const void* tagged) noexcept {
        return static_cast<std::size_t>(reinterpret_cast<std::uintptr_t>(tagged) &
                                        BlockConfig::kIndexMask);
    }
};

#if defined(ARENA64_STRICT_PROVENANCE)
using TagCodec = ProvenanceTagCodec;
#else
using TagCodec = IntegerTagCodec;
#endif

} // namespace arena64
