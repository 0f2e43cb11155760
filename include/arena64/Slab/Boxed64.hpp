#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <new>
#include <ostream>
#include <utility>

#include "arena64/Block/Bitmask.hpp"
#include "arena64/Block/Block.hpp"
#include "arena64/Block/TaggedPtr.hpp"
#include "arena64/Util/Log.hpp"

namespace arena64 {

template <typename T, typename Codec> class Boxed64;
template <typename T, typename Codec> class BoxedUninitSlot;

/**
 * BoxedSlot
 * ------------------------------------------------------------
 * Boxed64 交出的槽位持有者。与 Slot 的区别在于释放协议：
 * 用 fetch_xor 翻转自己的占用位；若 Boxed64 已析构且自己是最后一个，
 * 负责释放整个 Block。
 */
template <typename T, typename Codec = TagCodec>
class BoxedSlot {
public:
    using value_type = T;
    using block_type = Block<T>;

    BoxedSlot() noexcept = default;
    ~BoxedSlot() { Reset(); }

    BoxedSlot(BoxedSlot&& other) noexcept
        : tagged_(other.tagged_)
    {
        other.tagged_ = nullptr;
    }

    BoxedSlot& operator=(BoxedSlot&& other) noexcept {
        if (this != &other) {
            Reset();
            tagged_       = other.tagged_;
            other.tagged_ = nullptr;
        }
        return *this;
    }

    BoxedSlot(const BoxedSlot&)            = delete;
    BoxedSlot& operator=(const BoxedSlot&) = delete;

    T& operator*()  const noexcept { return *Get(); }
    T* operator->() const noexcept { return Get(); }

    T* Get() const noexcept {
        assert(tagged_ && "dereferencing an empty BoxedSlot");
        return GetBlock()->UncheckedAt(GetIndex());
    }

    explicit operator bool() const noexcept { return tagged_ != nullptr; }

    std::size_t GetIndex() const noexcept { return Codec::Index(tagged_); }
    block_type* GetBlock() const noexcept {
        return static_cast<block_type*>(Codec::Base(tagged_));
    }

    void* IntoRaw() noexcept {
        void* tagged = tagged_;
        tagged_ = nullptr;
        return tagged;
    }

    // 同 Slot::FromRaw：标记值必须来自 IntoRaw，且只能转回一次
    static BoxedSlot FromRaw(void* tagged) noexcept {
        BoxedSlot slot;
        slot.tagged_ = tagged;
        return slot;
    }

    // 移动构造抛异常时 BoxedSlot 仍持有原值，Block 不会因此泄漏
    T Take() {
        assert(tagged_ && "take from an empty BoxedSlot");
        block_type* owner = GetBlock();
        const std::size_t idx = GetIndex();

        T* cell = owner->UncheckedAt(idx);
        T value(std::move(*cell));
        tagged_ = nullptr;

        cell->~T();
        ReleaseShared_(owner, idx);
        return value;
    }

    void Reset() noexcept {
        if (tagged_) {
            block_type* owner = GetBlock();
            const std::size_t idx = GetIndex();
            tagged_ = nullptr;

            owner->UncheckedAt(idx)->~T();
            ReleaseShared_(owner, idx);
        }
    }

private:
    friend class Boxed64<T, Codec>;
    friend class BoxedUninitSlot<T, Codec>;

    BoxedSlot(block_type* owner, std::size_t idx) noexcept
        : tagged_(Codec::Encode(owner, idx))
    {}

    static void ReleaseShared_(block_type* owner, std::size_t idx) noexcept {
        const std::uint64_t bit  = Bitmask::BitOf(idx);
        const std::uint64_t prev = owner->GetBitmask().Toggle(idx);

        // Boxed64 析构时翻转了全部位：此时自己的位为 0。
        // 翻转后整字全 1，说明自己是最后一个持有者
        if (prev == ~bit) {
            delete owner;
        }
    }

    void* tagged_ = nullptr;
};

// 已占用、尚未构造的共享槽位。析构时按共享协议归还；Insert / Emplace 后转为 BoxedSlot。
// 构造抛异常时仍持有该槽位，由析构归还。
template <typename T, typename Codec = TagCodec>
class BoxedUninitSlot {
public:
    using block_type = Block<T>;
    using slot_type  = BoxedSlot<T, Codec>;

    BoxedUninitSlot() noexcept = default;
    ~BoxedUninitSlot() {
        if (block_) slot_type::ReleaseShared_(block_, index_);
    }

    BoxedUninitSlot(BoxedUninitSlot&& other) noexcept
        : block_(other.block_), index_(other.index_)
    {
        other.block_ = nullptr;
    }

    BoxedUninitSlot& operator=(BoxedUninitSlot&& other) noexcept {
        if (this != &other) {
            if (block_) slot_type::ReleaseShared_(block_, index_);
            block_       = other.block_;
            index_       = other.index_;
            other.block_ = nullptr;
        }
        return *this;
    }

    BoxedUninitSlot(const BoxedUninitSlot&)            = delete;
    BoxedUninitSlot& operator=(const BoxedUninitSlot&) = delete;

    explicit operator bool() const noexcept { return block_ != nullptr; }
    std::size_t GetIndex() const noexcept { return index_; }

    slot_type Insert(T value) {
        return Emplace(std::move(value));
    }

    template <typename... Args>
    slot_type Emplace(Args&&... args) {
        assert(block_ && "emplace into an empty BoxedUninitSlot");
        ::new (block_->UncheckedRaw(index_)) T(std::forward<Args>(args)...);

        block_type* owner = block_;
        block_ = nullptr;
        return slot_type(owner, index_);
    }

private:
    friend class Boxed64<T, Codec>;

    BoxedUninitSlot(block_type* owner, std::size_t idx) noexcept
        : block_(owner), index_(idx)
    {}

    block_type* block_ = nullptr;
    std::size_t index_ = 0;
};

/**
 * Boxed64
 * ------------------------------------------------------------
 * 堆上单 Block 槽位池，容量固定为 64。
 * 底层 Block 在 Boxed64 与所有 BoxedSlot / BoxedUninitSlot 都析构后才释放。
 */
template <typename T, typename Codec = TagCodec>
class Boxed64 {
public:
    using block_type       = Block<T>;
    using slot_type        = BoxedSlot<T, Codec>;
    using uninit_slot_type = BoxedUninitSlot<T, Codec>;

    static constexpr std::size_t kCapacity = block_type::kSlotCount;

    Boxed64()
        : block_(new block_type())
    {}

    ~Boxed64() {
        // 翻转全部位，通知仍在外的持有者由最后一个负责释放
        const std::uint64_t prev = block_->GetBitmask().ToggleAll();
        if (prev == 0) {
            delete block_;
        } else {
            ARENA64_LOG_DEBUG("boxed64 %p dropped with %zu outstanding slot(s); block %p deferred",
                              static_cast<void*>(this),
                              static_cast<std::size_t>(__builtin_popcountll(prev)),
                              static_cast<void*>(block_));
        }
    }

    Boxed64(const Boxed64&)            = delete;
    Boxed64& operator=(const Boxed64&) = delete;
    Boxed64(Boxed64&&)                 = delete;
    Boxed64& operator=(Boxed64&&)      = delete;

    // 已满时返回空的 BoxedUninitSlot
    uninit_slot_type TryClaim() noexcept {
        const std::size_t idx = block_->TryClaimIndex();
        if (idx == block_type::kNotFound) return uninit_slot_type();
        return uninit_slot_type(block_, idx);
    }

    // 已满时返回空的 BoxedSlot
    slot_type TryInsert(T value) {
        return TryEmplace(std::move(value));
    }

    template <typename... Args>
    slot_type TryEmplace(Args&&... args) {
        const std::size_t idx = block_->TryClaimIndex();
        if (idx == block_type::kNotFound) return slot_type();
        block_->Construct(idx, std::forward<Args>(args)...);
        return slot_type(block_, idx);
    }

    bool          IsFull()       const noexcept { return block_->IsFull(); }
    bool          IsEmpty()      const noexcept { return block_->IsEmpty(); }
    std::size_t   GetLiveCount() const noexcept { return block_->GetLiveCount(); }
    std::uint64_t GetOccupancy() const noexcept { return block_->GetOccupancy(); }

private:
    block_type* block_;
};

// ---- 按值比较 ----

template <typename T, typename C>
bool operator==(const BoxedSlot<T, C>& a, const BoxedSlot<T, C>& b) { return *a == *b; }

template <typename T, typename C>
bool operator!=(const BoxedSlot<T, C>& a, const BoxedSlot<T, C>& b) { return !(*a == *b); }

template <typename T, typename C>
bool operator<(const BoxedSlot<T, C>& a, const BoxedSlot<T, C>& b) { return *a < *b; }

template <typename T, typename C>
bool operator>(const BoxedSlot<T, C>& a, const BoxedSlot<T, C>& b) { return *b < *a; }

template <typename T, typename C>
bool operator<=(const BoxedSlot<T, C>& a, const BoxedSlot<T, C>& b) { return !(*b < *a); }

template <typename T, typename C>
bool operator>=(const BoxedSlot<T, C>& a, const BoxedSlot<T, C>& b) { return !(*a < *b); }

template <typename T, typename C>
bool operator==(const BoxedSlot<T, C>& a, const T& b) { return *a == b; }

template <typename T, typename C>
bool operator==(const T& a, const BoxedSlot<T, C>& b) { return a == *b; }

template <typename T, typename C>
bool operator!=(const BoxedSlot<T, C>& a, const T& b) { return !(*a == b); }

template <typename T, typename C>
bool operator!=(const T& a, const BoxedSlot<T, C>& b) { return !(a == *b); }

template <typename T, typename C>
std::ostream& operator<<(std::ostream& os, const BoxedSlot<T, C>& slot) {
    return os << *slot;
}

} // namespace arena64

namespace std {

template <typename T, typename C>
struct hash<arena64::BoxedSlot<T, C>> {
    std::size_t operator()(const arena64::BoxedSlot<T, C>& slot) const {
        return std::hash<T>()(*slot);
    }
};

} // namespace std
