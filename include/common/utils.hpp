#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace dexbook {

inline bool pin_thread_to_core(int core_id) noexcept {
#ifdef __linux__
    if (core_id < 0) return false;
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#else
    (void)core_id;
    return false;
#endif
}

constexpr bool is_power_of_two(size_t n) noexcept {
    return n > 0 && (n & (n - 1)) == 0;
}

/// a * b, or nullopt on u64 overflow.
constexpr std::optional<uint64_t> checked_mul(uint64_t a, uint64_t b) noexcept {
    uint64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) [[unlikely]] {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<uint64_t> checked_add(uint64_t a, uint64_t b) noexcept {
    uint64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) [[unlikely]] {
        return std::nullopt;
    }
    return result;
}

} // namespace dexbook
