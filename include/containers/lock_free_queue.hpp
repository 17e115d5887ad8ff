#pragma once

#include "common/utils.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <type_traits>

namespace dexbook {

/// Single-producer single-consumer ring buffer.
/// Capacity must be a power of 2; one slot stays empty to tell full from empty.
/// Each side keeps a cached copy of the other side's index so the shared
/// cache line is only touched when the cached value says full/empty.
template<typename T, size_t Capacity>
class LockFreeRingBuffer {
    static_assert(is_power_of_two(Capacity), "Capacity must be a power of 2");
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

public:
    LockFreeRingBuffer()
        : buffer_(std::make_unique<T[]>(Capacity)) {}

    LockFreeRingBuffer(const LockFreeRingBuffer&) = delete;
    LockFreeRingBuffer& operator=(const LockFreeRingBuffer&) = delete;

    /// Producer only. Returns false if full.
    bool try_push(const T& item) noexcept {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) & MASK;
        if (next == cached_head_) {
            cached_head_ = head_.load(std::memory_order_acquire);
            if (next == cached_head_) {
                return false;
            }
        }
        buffer_[tail] = item;
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Consumer only. Returns false if empty.
    bool try_pop(T& item) noexcept {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == cached_tail_) {
            cached_tail_ = tail_.load(std::memory_order_acquire);
            if (head == cached_tail_) {
                return false;
            }
        }
        item = buffer_[head];
        head_.store((head + 1) & MASK, std::memory_order_release);
        return true;
    }

    /// Consumer only. Pops everything currently visible into fn; returns the count.
    template<typename Fn>
    size_t drain(Fn&& fn) {
        size_t n = 0;
        T item;
        while (try_pop(item)) {
            fn(item);
            ++n;
        }
        return n;
    }

    size_t size() const noexcept {
        const size_t tail = tail_.load(std::memory_order_acquire);
        const size_t head = head_.load(std::memory_order_acquire);
        return (tail - head) & MASK;
    }

    bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() noexcept { return Capacity - 1; }

private:
    static constexpr size_t MASK = Capacity - 1;

    // Consumer-owned line
    alignas(64) std::atomic<size_t> head_{0};
    size_t cached_tail_ = 0;

    // Producer-owned line
    alignas(64) std::atomic<size_t> tail_{0};
    size_t cached_head_ = 0;

    std::unique_ptr<T[]> buffer_;
};

} // namespace dexbook
