#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#if defined(_MSC_VER) || defined(__x86_64__) || defined(__i386__)
  #include <immintrin.h>
  #define SPSC_PAUSE() _mm_pause()
#elif defined(__aarch64__) || defined(__arm__)
  #define SPSC_PAUSE() __asm__ __volatile__("yield")
#else
  #define SPSC_PAUSE() do {} while(0)
#endif

namespace spsc {

// 64B cache line padding (common on x86_64); adjust if you profile different HW.
inline constexpr std::size_t kCacheLine = 64;

struct CachePad {
    alignas(kCacheLine) std::byte pad[kCacheLine];
};

// Memory order helpers for readability
constexpr auto RELAXED = std::memory_order_relaxed;
constexpr auto ACQUIRE = std::memory_order_acquire;
constexpr auto RELEASE = std::memory_order_release;

constexpr bool is_pow2(std::size_t x) noexcept {
    return x != 0 && (x & (x - 1)) == 0;
}

// Logical cursor -> physical slot. Power-of-two capacities use the mask.
template <std::size_t N>
constexpr std::size_t wrap(std::uint64_t idx) noexcept {
    if constexpr (is_pow2(N)) {
        return static_cast<std::size_t>(idx & (N - 1));
    } else {
        return static_cast<std::size_t>(idx % N);
    }
}

// Busy-wait lock: never parks the thread.
class SpinLock {
public:
    void lock() noexcept {
        while (flag_.test_and_set(ACQUIRE)) { SPSC_PAUSE(); }
    }
    void unlock() noexcept { flag_.clear(RELEASE); }

private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

} // namespace spsc
