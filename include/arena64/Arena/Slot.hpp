#pragma once

#include <cassert>
#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

#include "arena64/Block/Block.hpp"
#include "arena64/Block/TaggedPtr.hpp"

namespace arena64 {

template <typename T, typename Codec> class Arena;
template <typename T, typename Codec> class UninitSlot;

/**
 * Slot
 * ------------------------------------------------------------
 * 对某个 Block 中某个槽位的独占持有者（只可移动，不可复制）。
 * 物理上只有一个指针宽度的成员：Block 基址 | 槽位下标。
 *
 * 析构时：析构槽位中的值，再清除占用位。
 * 被移动后的 Slot 为空，析构不做任何事。
 *
 * 所属 Arena / Fixed64 必须比 Slot 活得久。
 */
template <typename T, typename Codec = TagCodec>
class Slot {
public:
    using value_type = T;
    using block_type = Block<T>;
    using codec_type = Codec;

    Slot() noexcept = default;
    ~Slot() { Reset(); }

    Slot(Slot&& other) noexcept
        : tagged_(other.tagged_)
    {
        other.tagged_ = nullptr;
    }

    Slot& operator=(Slot&& other) noexcept {
        if (this != &other) {
            Reset();
            tagged_       = other.tagged_;
            other.tagged_ = nullptr;
        }
        return *this;
    }

    Slot(const Slot&)            = delete;
    Slot& operator=(const Slot&) = delete;

    // ---- 访问 ----
    T& operator*()  const noexcept { return *Get(); }
    T* operator->() const noexcept { return Get(); }

    T* Get() const noexcept {
        assert(tagged_ && "dereferencing an empty Slot");
        return GetBlock()->At(GetIndex());
    }

    explicit operator bool() const noexcept { return tagged_ != nullptr; }

    std::size_t GetIndex() const noexcept { return Codec::Index(tagged_); }
    block_type* GetBlock() const noexcept {
        return static_cast<block_type*>(Codec::Base(tagged_));
    }

    // ---- 标记指针 ----

    // 交出所有权，返回 (Block 基址 | 下标)。不释放槽位。
    // 需要再经 FromRaw 转回 Slot，值才会被析构。
    void* IntoRaw() noexcept {
        void* tagged = tagged_;
        tagged_ = nullptr;
        return tagged;
    }

    // 由 IntoRaw 的结果重建 Slot。不做任何校验：
    // 同一个标记值只能转回一次，且所属 Block 仍须存活。
    static Slot FromRaw(void* tagged) noexcept {
        Slot slot;
        slot.tagged_ = tagged;
        return slot;
    }

    // ---- 释放 ----

    // 取出值并释放槽位。移动构造抛异常时 Slot 仍持有原值
    T Take() {
        assert(tagged_ && "take from an empty Slot");
        block_type* owner = GetBlock();
        const std::size_t idx = GetIndex();

        T* cell = owner->At(idx);
        T value(std::move(*cell));
        tagged_ = nullptr;

        cell->~T();
        owner->ReleaseUninit(idx);
        return value;
    }

    void Reset() noexcept {
        if (tagged_) {
            GetBlock()->Release(GetIndex());
            tagged_ = nullptr;
        }
    }

private:
    friend class Arena<T, Codec>;
    friend class UninitSlot<T, Codec>;

    // 调用方已占用 (block, index) 且已构造值
    Slot(block_type* owner, std::size_t idx) noexcept
        : tagged_(Codec::Encode(owner, idx))
    {}

    void* tagged_ = nullptr;
};

// ---- 按值比较 ----

template <typename T, typename C>
bool operator==(const Slot<T, C>& a, const Slot<T, C>& b) { return *a == *b; }

template <typename T, typename C>
bool operator!=(const Slot<T, C>& a, const Slot<T, C>& b) { return !(*a == *b); }

template <typename T, typename C>
bool operator<(const Slot<T, C>& a, const Slot<T, C>& b) { return *a < *b; }

template <typename T, typename C>
bool operator>(const Slot<T, C>& a, const Slot<T, C>& b) { return *b < *a; }

template <typename T, typename C>
bool operator<=(const Slot<T, C>& a, const Slot<T, C>& b) { return !(*b < *a); }

template <typename T, typename C>
bool operator>=(const Slot<T, C>& a, const Slot<T, C>& b) { return !(*a < *b); }

template <typename T, typename C>
bool operator==(const Slot<T, C>& a, const T& b) { return *a == b; }

template <typename T, typename C>
bool operator==(const T& a, const Slot<T, C>& b) { return a == *b; }

template <typename T, typename C>
bool operator!=(const Slot<T, C>& a, const T& b) { return !(*a == b); }

template <typename T, typename C>
bool operator!=(const T& a, const Slot<T, C>& b) { return !(a == *b); }

template <typename T, typename C>
std::ostream& operator<<(std::ostream& os, const Slot<T, C>& slot) {
    return os << *slot;
}

} // namespace arena64

namespace std {

template <typename T, typename C>
struct hash<arena64::Slot<T, C>> {
    std::size_t operator()(const arena64::Slot<T, C>& slot) const {
        return std::hash<T>()(*slot);
    }
};

} // namespace std
