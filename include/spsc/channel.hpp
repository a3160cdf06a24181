#pragma once
#include <cstddef>
#include <memory>
#include <utility>
#include "result.hpp"
#include "ring_state.hpp"
#include "sync.hpp"
#include "utils.hpp"

namespace spsc {

inline constexpr std::size_t kDefaultCapacity = 512;

template <class T, std::size_t N = kDefaultCapacity, class Sync = LockFree>
class Producer;

template <class T, std::size_t N = kDefaultCapacity, class Sync = LockFree>
class Consumer;

// Allocates one RingState and binds exactly one Producer and one Consumer to it.
template <class T, std::size_t N = kDefaultCapacity, class Sync = LockFree>
std::pair<Producer<T, N, Sync>, Consumer<T, N, Sync>> channel() {
    auto state = std::make_shared<RingState<T, N, Sync>>();
    return {Producer<T, N, Sync>(state), Consumer<T, N, Sync>(std::move(state))};
}

// Sending half. Use from one thread at a time; move it to hand it over.
template <class T, std::size_t N, class Sync>
class Producer {
public:
    using State = RingState<T, N, Sync>;

    Producer(Producer&&) noexcept = default;
    Producer& operator=(Producer&& other) noexcept {
        if (this != &other) {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    ~Producer() { release(); }

    static constexpr std::size_t capacity() noexcept { return N; }

    // Spins while the ring is full. Fails, handing `value` back, once the
    // Consumer has been destroyed: either before the call or during the wait.
    SendResult<T> send(T value) {
        if (!state_->consumer_alive()) return SendError<T>{std::move(value)};
        for (;;) {
            if (state_->try_push(std::move(value))) return {};
            if (!state_->consumer_alive()) return SendError<T>{std::move(value)};
            SPSC_PAUSE();
        }
    }

    // Number of values sent but not yet received; never above capacity().
    std::size_t size() const noexcept { return state_->size_from_producer(); }

    // True once the Consumer is gone; every further send() fails.
    bool is_closed() const noexcept { return !state_->consumer_alive(); }

private:
    template <class U, std::size_t M, class S>
    friend std::pair<Producer<U, M, S>, Consumer<U, M, S>> channel();

    explicit Producer(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

    void release() noexcept {
        if (state_) {
            state_->close_producer();
            state_.reset();
        }
    }

    std::shared_ptr<State> state_;
};

// Receiving half. Use from one thread at a time; move it to hand it over.
template <class T, std::size_t N, class Sync>
class Consumer {
public:
    using State = RingState<T, N, Sync>;

    Consumer(Consumer&&) noexcept = default;
    Consumer& operator=(Consumer&& other) noexcept {
        if (this != &other) {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    ~Consumer() { release(); }

    static constexpr std::size_t capacity() noexcept { return N; }

    // Spins while the ring is empty and the Producer is alive. Fails once the
    // Producer is gone and everything it sent has been received.
    // The value moves from its slot directly into the returned result.
    RecvResult<T> recv() {
        RecvResult<T> out = RecvError{};
        for (;;) {
            // Liveness before cursors: a 0 seen here covers the final write cursor.
            const bool producer_gone = !state_->producer_alive();
            if (state_->try_pop(out) || producer_gone) return out;
            SPSC_PAUSE();
        }
    }

    std::size_t size() const noexcept { return state_->size_from_consumer(); }

    // True once the Producer is gone. Values it sent may still be buffered.
    bool is_closed() const noexcept { return !state_->producer_alive(); }

private:
    template <class U, std::size_t M, class S>
    friend std::pair<Producer<U, M, S>, Consumer<U, M, S>> channel();

    explicit Consumer(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

    void release() noexcept {
        if (state_) {
            state_->close_consumer();
            state_.reset();
        }
    }

    std::shared_ptr<State> state_;
};

} // namespace spsc
