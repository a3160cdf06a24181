#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include "utils.hpp"

namespace spsc {

// Cursor policies for RingState. Both keep, for logical cursors r <= w:
//
//    w - r <= capacity           (never more than N published slots)
//    slot k is live  <=>  r <= k < w
//
// produce(cap, write) calls write(w) only when w - r < cap and then advances w.
// consume(read)       calls read(r)  only when r < w       and then advances r.
// If the callback throws, the cursor is left where it was.

// Lock-free: one writer per cursor, so a plain store publishes it.
//   producer:  own w RELAXED, peer r ACQUIRE  -> slot write -> w RELEASE
//   consumer:  own r RELAXED, peer w ACQUIRE  -> slot read  -> r RELEASE
// The ACQUIRE of w pairs with the producer's RELEASE of w, so the payload
// construction is visible before the consumer touches the slot. The ACQUIRE
// of r pairs with the consumer's RELEASE of r, so the payload destruction is
// finished before the producer reuses the slot.
class LockFree {
public:
    template <class Write>
    bool produce(std::size_t capacity, Write&& write) {
        const std::uint64_t w = write_.load(RELAXED);
        const std::uint64_t r = read_.load(ACQUIRE);
        if (w - r >= capacity) return false; // full
        write(w);
        write_.store(w + 1, RELEASE);
        return true;
    }

    template <class Read>
    bool consume(Read&& read) {
        const std::uint64_t r = read_.load(RELAXED);
        const std::uint64_t w = write_.load(ACQUIRE);
        if (r == w) return false; // empty
        read(r);
        read_.store(r + 1, RELEASE);
        return true;
    }

    // Own cursor first: the peer can only move its cursor towards ours, so the
    // difference stays within [0, capacity].
    std::uint64_t producer_view() const noexcept {
        const std::uint64_t w = write_.load(RELAXED);
        return w - read_.load(ACQUIRE);
    }

    std::uint64_t consumer_view() const noexcept {
        const std::uint64_t r = read_.load(RELAXED);
        return write_.load(ACQUIRE) - r;
    }

private:
    alignas(kCacheLine) std::atomic<std::uint64_t> read_{0};
    CachePad _pad1_;
    alignas(kCacheLine) std::atomic<std::uint64_t> write_{0};
    CachePad _pad2_;
};

// Spin-locked: cursor reads, the capacity check, the slot access and the
// cursor update form one critical section per call. Mutual exclusion gives
// the ordering, so the cursors are plain integers.
class Spinlocked {
public:
    template <class Write>
    bool produce(std::size_t capacity, Write&& write) {
        std::lock_guard<SpinLock> guard(lock_);
        if (write_ - read_ >= capacity) return false;
        write(write_);
        ++write_;
        return true;
    }

    template <class Read>
    bool consume(Read&& read) {
        std::lock_guard<SpinLock> guard(lock_);
        if (read_ == write_) return false;
        read(read_);
        ++read_;
        return true;
    }

    std::uint64_t producer_view() const noexcept { return snapshot(); }
    std::uint64_t consumer_view() const noexcept { return snapshot(); }

private:
    std::uint64_t snapshot() const noexcept {
        std::lock_guard<SpinLock> guard(lock_);
        return write_ - read_;
    }

    mutable SpinLock lock_;
    std::uint64_t read_ = 0;
    std::uint64_t write_ = 0;
};

} // namespace spsc
