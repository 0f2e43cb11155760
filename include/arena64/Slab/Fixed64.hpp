#pragma once

#include <cassert>
#include <cstddef>
#include <utility>

#include "arena64/Arena/Slot.hpp"
#include "arena64/Block/Block.hpp"
#include "arena64/Block/TaggedPtr.hpp"
#include "arena64/Util/Log.hpp"

namespace arena64 {

template <typename T, typename Codec> class Fixed64;

// 已占用、尚未构造的槽位。析构时只清位；Insert / Emplace 后转为 Slot。
template <typename T, typename Codec = TagCodec>
class UninitSlot {
public:
    using block_type = Block<T>;
    using slot_type  = Slot<T, Codec>;

    UninitSlot() noexcept = default;
    ~UninitSlot() {
        if (block_) block_->ReleaseUninit(index_);
    }

    UninitSlot(UninitSlot&& other) noexcept
        : block_(other.block_), index_(other.index_)
    {
        other.block_ = nullptr;
    }

    UninitSlot& operator=(UninitSlot&& other) noexcept {
        if (this != &other) {
            if (block_) block_->ReleaseUninit(index_);
            block_       = other.block_;
            index_       = other.index_;
            other.block_ = nullptr;
        }
        return *this;
    }

    UninitSlot(const UninitSlot&)            = delete;
    UninitSlot& operator=(const UninitSlot&) = delete;

    explicit operator bool() const noexcept { return block_ != nullptr; }
    std::size_t GetIndex() const noexcept { return index_; }

    slot_type Insert(T value) {
        return Emplace(std::move(value));
    }

    // 构造失败时 Block::Construct 已清位，这里先放手避免重复释放
    template <typename... Args>
    slot_type Emplace(Args&&... args) {
        assert(block_ && "emplace into an empty UninitSlot");
        block_type* owner = block_;
        block_ = nullptr;
        owner->Construct(index_, std::forward<Args>(args)...);
        return slot_type(owner, index_);
    }

private:
    friend class Fixed64<T, Codec>;

    UninitSlot(block_type* owner, std::size_t idx) noexcept
        : block_(owner), index_(idx)
    {}

    block_type* block_ = nullptr;
    std::size_t index_ = 0;
};

/**
 * Fixed64
 * ------------------------------------------------------------
 * 不做堆分配的单 Block 槽位池：容量固定为 64，不扩容。
 * 可直接放在栈上或作为成员；交出的 Slot 与 Arena 的 Slot 是同一类型。
 */
template <typename T, typename Codec = TagCodec>
class Fixed64 {
public:
    using block_type       = Block<T>;
    using slot_type        = Slot<T, Codec>;
    using uninit_slot_type = UninitSlot<T, Codec>;

    static constexpr std::size_t kCapacity = block_type::kSlotCount;

    Fixed64() noexcept = default;

    ~Fixed64() {
        const std::size_t leaked = block_.DestroyLive();
        if (leaked != 0) {
            ARENA64_LOG_WARN("fixed64 %p destroyed with %zu live slot(s); values destroyed",
                             static_cast<void*>(this), leaked);
        }
    }

    Fixed64(const Fixed64&)            = delete;
    Fixed64& operator=(const Fixed64&) = delete;
    Fixed64(Fixed64&&)                 = delete;
    Fixed64& operator=(Fixed64&&)      = delete;

    // 已满时返回空的 UninitSlot
    uninit_slot_type TryClaim() noexcept {
        const std::size_t idx = block_.TryClaimIndex();
        if (idx == block_type::kNotFound) return uninit_slot_type();
        return uninit_slot_type(&block_, idx);
    }

    // 已满时返回空的 Slot
    slot_type TryInsert(T value) {
        uninit_slot_type uninit = TryClaim();
        if (!uninit) return slot_type();
        return uninit.Insert(std::move(value));
    }

    bool        IsFull()       const noexcept { return block_.IsFull(); }
    bool        IsEmpty()      const noexcept { return block_.IsEmpty(); }
    std::size_t GetLiveCount() const noexcept { return block_.GetLiveCount(); }

    const block_type& GetBlock() const noexcept { return block_; }

private:
    block_type block_;
};

} // namespace arena64
