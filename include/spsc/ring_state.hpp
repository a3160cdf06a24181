#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include "slot.hpp"
#include "sync.hpp"
#include "utils.hpp"

namespace spsc {

// Storage and bookkeeping shared by one Producer and one Consumer.
//
// Single writer per field:
//   write cursor   - producer thread (through try_push)
//   read cursor    - consumer thread (through try_pop)
//   producer_live_ - Producer destructor
//   consumer_live_ - Consumer destructor
//
// The liveness flags go 1 -> 0 once and never come back. The store is
// RELEASE, so a peer that ACQUIREs 0 also sees every cursor update the
// departed side made before leaving.
template <class T, std::size_t N, class Sync = LockFree>
class RingState {
    static_assert(N >= 1, "capacity must be at least one slot");

public:
    RingState() = default;

    // Leftovers (slots in [read, write) once both handles are gone) are
    // destroyed by each Slot's own destructor.
    ~RingState() = default;

    RingState(const RingState&) = delete;
    RingState& operator=(const RingState&) = delete;

    // Producer side. `value` is only moved from when this returns true.
    template <class U>
    bool try_push(U&& value) {
        return cursors_.produce(N, [&](std::uint64_t idx) {
            slots_[wrap<N>(idx)].construct(std::forward<U>(value));
        });
    }

    // Consumer side. Moves the oldest value straight into `out` (anything
    // with emplace(T&&)); the read cursor only advances once that succeeded.
    template <class Out>
    bool try_pop(Out& out) {
        return cursors_.consume([&](std::uint64_t idx) {
            slots_[wrap<N>(idx)].move_out_and_destroy(out);
        });
    }

    void close_producer() noexcept { producer_live_.store(0, RELEASE); }
    void close_consumer() noexcept { consumer_live_.store(0, RELEASE); }

    bool producer_alive() const noexcept { return producer_live_.load(ACQUIRE) != 0; }
    bool consumer_alive() const noexcept { return consumer_live_.load(ACQUIRE) != 0; }

    std::size_t size_from_producer() const noexcept {
        return static_cast<std::size_t>(cursors_.producer_view());
    }
    std::size_t size_from_consumer() const noexcept {
        return static_cast<std::size_t>(cursors_.consumer_view());
    }

private:
    Sync cursors_;

    alignas(kCacheLine) std::atomic<std::uint32_t> producer_live_{1};
    alignas(kCacheLine) std::atomic<std::uint32_t> consumer_live_{1};

    std::array<Slot<T>, N> slots_;
};

} // namespace spsc
