#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <utility>

namespace dexbook {

/// Fixed-capacity object pool sized at construction.
/// Single-threaded. Slots are threaded into an index-based free list, so
/// acquire/release are O(1) and nothing is allocated after construction.
template<typename T>
class ObjectPool {
public:
    explicit ObjectPool(size_t capacity)
        : slots_(std::make_unique<Slot[]>(capacity))
        , capacity_(capacity)
    {
        for (size_t i = 0; i < capacity_; ++i) {
            slots_[i].next_free = static_cast<uint32_t>(i + 1);
        }
        free_head_ = capacity_ > 0 ? 0 : INVALID;
        if (capacity_ > 0) {
            slots_[capacity_ - 1].next_free = INVALID;
        }
    }

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    ~ObjectPool() {
        for (size_t i = 0; i < capacity_; ++i) {
            if (slots_[i].live) {
                slots_[i].object()->~T();
            }
        }
    }

    /// Construct a T in a free slot. Returns nullptr if the pool is exhausted.
    template<typename... Args>
    T* acquire(Args&&... args) {
        if (free_head_ == INVALID) {
            return nullptr;
        }
        Slot& slot = slots_[free_head_];
        free_head_ = slot.next_free;
        T* obj = new (slot.storage) T{std::forward<Args>(args)...};
        slot.live = true;
        ++in_use_;
        return obj;
    }

    /// Destroy obj and return its slot to the free list.
    void release(T* obj) noexcept {
        if (!obj) return;
        Slot* slot = reinterpret_cast<Slot*>(reinterpret_cast<unsigned char*>(obj) - offsetof(Slot, storage));
        obj->~T();
        slot->live = false;
        slot->next_free = free_head_;
        free_head_ = static_cast<uint32_t>(slot - slots_.get());
        --in_use_;
    }

    size_t in_use() const noexcept { return in_use_; }
    size_t available() const noexcept { return capacity_ - in_use_; }
    size_t capacity() const noexcept { return capacity_; }

private:
    static constexpr uint32_t INVALID = 0xFFFFFFFF;

    struct Slot {
        alignas(T) unsigned char storage[sizeof(T)];
        uint32_t next_free = INVALID;
        bool live = false;

        T* object() noexcept { return std::launder(reinterpret_cast<T*>(storage)); }
    };

    std::unique_ptr<Slot[]> slots_;
    size_t capacity_;
    uint32_t free_head_ = INVALID;
    size_t in_use_ = 0;
};

} // namespace dexbook
