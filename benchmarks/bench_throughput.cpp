// benchmarks/bench_throughput.cpp — spsc channel vs. a mutex/condvar queue

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "spsc/channel.hpp"

using SteadyClock = std::chrono::steady_clock;

static std::uint64_t parse_u64(const char* s, std::uint64_t def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && *end == '\0') ? static_cast<std::uint64_t>(v) : def;
}

// Baseline: unbounded queue, blocking receive, closed when the sender is done.
class MutexQueue {
public:
    void send(std::uint64_t v) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            q_.push_back(v);
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_one();
    }

    std::optional<std::uint64_t> recv() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&] { return !q_.empty() || closed_; });
        if (q_.empty()) return std::nullopt;
        std::uint64_t v = q_.front();
        q_.pop_front();
        return v;
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::uint64_t> q_;
    bool closed_ = false;
};

template <class Sync>
static std::uint64_t run_spsc(std::uint64_t count) {
    auto [px, cx] = spsc::channel<std::uint64_t, spsc::kDefaultCapacity, Sync>();
    std::thread prod([px = std::move(px), count]() mutable {
        for (std::uint64_t i = 0; i < count; ++i) {
            if (!px.send(i).ok()) return;
        }
    });
    std::uint64_t sum = 0;
    for (;;) {
        auto r = cx.recv();
        if (!r.ok()) break;
        sum += r.value();
    }
    prod.join();
    return sum;
}

static std::uint64_t run_mutex(std::uint64_t count) {
    MutexQueue q;
    std::thread prod([&q, count] {
        for (std::uint64_t i = 0; i < count; ++i) q.send(i);
        q.close();
    });
    std::uint64_t sum = 0;
    while (auto v = q.recv()) sum += *v;
    prod.join();
    return sum;
}

template <class Fn>
static bool measure(const char* name, std::uint64_t count, std::uint64_t repeats, Fn&& fn) {
    const std::uint64_t expected = count * (count - 1) / 2;
    bool ok = true;
    auto t0 = SteadyClock::now();
    for (std::uint64_t i = 0; i < repeats; ++i) {
        if (fn(count) != expected) ok = false;
    }
    auto t1 = SteadyClock::now();

    const double secs = std::chrono::duration<double>(t1 - t0).count();
    const double ops  = static_cast<double>(count * repeats);
    const double ops_per_s = (secs > 0.0) ? (ops / secs) : 0.0;
    std::cout << "  " << std::left << std::setw(12) << name << std::right
              << " count=" << std::setw(6) << count
              << "  elapsed (s): " << std::setw(8) << secs
              << "  throughput: " << std::setw(8) << (ops_per_s / 1e6) << " Mops/s"
              << (ok ? "" : "  SUM MISMATCH") << "\n";
    return ok;
}

int main(int argc, char** argv) {
    // Args: [count (0 = sweep 2^8..2^12)] [repeats]
    const std::uint64_t COUNT   = parse_u64(argc > 1 ? argv[1] : nullptr, 0);
    const std::uint64_t REPEATS = parse_u64(argc > 2 ? argv[2] : nullptr, 200);

    std::vector<std::uint64_t> counts;
    if (COUNT == 0) {
        for (int n = 8; n <= 12; ++n) counts.push_back(1ULL << n);
    } else {
        counts.push_back(COUNT);
    }

    std::cout << "Benchmark config:\n"
              << "  count (0=sweep)    = " << COUNT << "\n"
              << "  repeats            = " << REPEATS << "\n"
              << "  channel capacity   = " << spsc::kDefaultCapacity << "\n";

    std::cout << std::fixed << std::setprecision(3);
    bool ok = true;
    for (std::uint64_t count : counts) {
        std::cout << "Results (" << count << " messages):\n";
        ok &= measure("spsc", count, REPEATS, run_spsc<spsc::LockFree>);
        ok &= measure("spsc-spin", count, REPEATS, run_spsc<spsc::Spinlocked>);
        ok &= measure("mutex", count, REPEATS, run_mutex);
    }
    return ok ? 0 : 1;
}
