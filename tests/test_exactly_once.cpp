#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <vector>
#include "spsc/channel.hpp"

using u64 = std::uint64_t;
using SteadyClock = std::chrono::steady_clock;

struct Cfg {
    u64 items = 1'000'000;
    int trials = 100;
    u64 seed = 0x5eed;
};

static u64 parse_u64(const char* s, u64 def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && *end == '\0') ? static_cast<u64>(v) : def;
}

// Every live Tracked owns one key in the registry. Constructing a key twice
// or releasing it twice is a bookkeeping error.
namespace registry {
std::mutex mu;
std::set<int> live;
std::atomic<int> errors{0};

void acquire(int key) {
    std::lock_guard<std::mutex> lock(mu);
    if (!live.insert(key).second) {
        std::cerr << "ERROR: double construction of key=" << key << "\n";
        errors.fetch_add(1);
    }
}

void release(int key) {
    std::lock_guard<std::mutex> lock(mu);
    if (live.erase(key) == 0) {
        std::cerr << "ERROR: double release of key=" << key << "\n";
        errors.fetch_add(1);
    }
}

std::size_t size() {
    std::lock_guard<std::mutex> lock(mu);
    return live.size();
}
} // namespace registry

class Tracked {
public:
    explicit Tracked(int key) : key_(key), owns_(true) { registry::acquire(key_); }
    Tracked(Tracked&& o) noexcept : key_(o.key_), owns_(o.owns_) { o.owns_ = false; }
    Tracked& operator=(Tracked&&) = delete;
    Tracked(const Tracked&) = delete;
    ~Tracked() { if (owns_) registry::release(key_); }

    int key() const noexcept { return key_; }

private:
    int key_;
    bool owns_;
};

// Producer sends until the consumer goes away; the consumer takes `take`
// values, lingers a random while, then drops. Whatever is left in the ring
// (and the rejected value) must be released exactly once.
template <class Sync>
void unused_values_released(const Cfg& cfg) {
    std::mt19937_64 rng(cfg.seed);
    for (int trial = 0; trial < cfg.trials; ++trial) {
        auto [p, c] = spsc::channel<Tracked, 64, Sync>();
        std::atomic<int> sent{0};

        std::thread prod([p = std::move(p), &sent]() mutable {
            for (int k = 0;; ++k) {
                auto r = p.send(Tracked(k));
                if (!r.ok()) {
                    assert(r.error().value.key() == k);
                    return;
                }
                sent.fetch_add(1, std::memory_order_relaxed);
            }
        });

        const int take = trial;
        for (int i = 0; i < take; ++i) {
            auto r = c.recv();
            assert(r.ok() && r.value().key() == i);
        }
        std::this_thread::sleep_for(std::chrono::microseconds(rng() % 200));
        { auto gone = std::move(c); }

        prod.join();
        assert(sent.load() >= take);
        if (registry::size() != 0) {
            std::cerr << "ERROR: trial " << trial << " leaked " << registry::size() << " values\n";
            std::abort();
        }
    }
    assert(registry::errors.load() == 0);
    std::cout << "unused values released ran (" << cfg.trials << " trials)\n";
}

// Both handles dropped with values still buffered, in a random order.
template <class Sync>
void buffered_values_released(const Cfg& cfg) {
    std::mt19937_64 rng(cfg.seed + 1);
    for (int trial = 0; trial < cfg.trials; ++trial) {
        auto ch = spsc::channel<Tracked, 16, Sync>();
        const int n = static_cast<int>(rng() % 17);
        for (int k = 0; k < n; ++k) {
            auto r = ch.first.send(Tracked(k));
            assert(r.ok());
            (void)r;
        }
        const int drained = n == 0 ? 0 : static_cast<int>(rng() % static_cast<u64>(n));
        for (int k = 0; k < drained; ++k) {
            auto r = ch.second.recv();
            assert(r.ok() && r.value().key() == k);
        }
        assert(registry::size() == static_cast<std::size_t>(n - drained));

        if (rng() & 1) {
            { auto gone = std::move(ch.first); }
            { auto gone = std::move(ch.second); }
        } else {
            { auto gone = std::move(ch.second); }
            { auto gone = std::move(ch.first); }
        }
        assert(registry::size() == 0);
    }
    assert(registry::errors.load() == 0);
    std::cout << "buffered values released ran (" << cfg.trials << " trials)\n";
}

template <class Sync>
void all_values_arrive(const Cfg& cfg) {
    constexpr int ELEMS = 1000;
    for (int trial = 0; trial < cfg.trials; ++trial) {
        auto [p, c] = spsc::channel<int, spsc::kDefaultCapacity, Sync>();

        std::thread cons([c = std::move(c)]() mutable {
            int count = 0;
            while (c.recv().ok()) ++count;
            assert(count == ELEMS);
        });

        std::thread prod([p = std::move(p)]() mutable {
            for (int i = 0; i < ELEMS; ++i) {
                auto r = p.send(i);
                assert(r.ok());
                (void)r;
            }
        });

        prod.join();
        cons.join();
    }
    std::cout << "all values arrive ran (" << cfg.trials << " trials)\n";
}

template <class Sync>
void exactly_once_transfer(const Cfg& cfg, const char* name) {
    const u64 TOTAL = cfg.items;
    std::vector<std::atomic<std::uint8_t>> visited(TOTAL);
    for (auto& a : visited) a.store(0, std::memory_order_relaxed);

    auto [p, c] = spsc::channel<u64, 1024, Sync>();
    std::atomic<bool> go{false};
    u64 consumed = 0;
    u64 out_of_order = 0;

    std::thread prod([p = std::move(p), &go, TOTAL]() mutable {
        while (!go.load(std::memory_order_acquire)) {}
        for (u64 i = 0; i < TOTAL; ++i) {
            auto r = p.send(i);
            assert(r.ok());
            (void)r;
        }
    });

    auto t0 = SteadyClock::now();
    go.store(true, std::memory_order_release);

    u64 expected = 0;
    for (;;) {
        auto r = c.recv();
        if (!r.ok()) break;
        const u64 id = r.value();
        if (id >= TOTAL) { std::cerr << "ERROR: out-of-range id=" << id << "\n"; std::abort(); }
        if (visited[id].exchange(1, std::memory_order_relaxed) != 0) {
            std::cerr << "ERROR: duplicate id=" << id << "\n";
            std::abort();
        }
        if (id != expected) ++out_of_order;
        expected = id + 1;
        ++consumed;
    }
    prod.join();
    auto t1 = SteadyClock::now();

    u64 misses = 0;
    for (u64 i = 0; i < TOTAL; ++i) {
        if (visited[i].load(std::memory_order_relaxed) != 1) {
            if (++misses <= 10) std::cerr << "Missing id=" << i << "\n";
        }
    }

    const double secs = std::chrono::duration<double>(t1 - t0).count();
    std::cout << "Exactly-once verification (" << name << "):\n"
              << "  total expected  = " << TOTAL << "\n"
              << "  total consumed  = " << consumed << "\n"
              << "  missing         = " << misses << "\n"
              << "  out of order    = " << out_of_order << "\n"
              << "  elapsed (s)     = " << std::fixed << std::setprecision(3) << secs << "\n";
    std::cout.unsetf(std::ios::floatfield);

    assert(consumed == TOTAL && "Consumed count mismatch");
    assert(misses == 0 && "Missing items detected");
    assert(out_of_order == 0 && "FIFO order violated");
}

template <class Sync>
void run_all(const Cfg& cfg, const char* name) {
    std::cout << "== " << name << "\n";
    unused_values_released<Sync>(cfg);
    buffered_values_released<Sync>(cfg);
    all_values_arrive<Sync>(cfg);
    exactly_once_transfer<Sync>(cfg, name);
}

int main(int argc, char** argv) {
    Cfg cfg;
    if (argc > 1) cfg.items  = parse_u64(argv[1], cfg.items);
    if (argc > 2) cfg.trials = static_cast<int>(parse_u64(argv[2], static_cast<u64>(cfg.trials)));
    if (argc > 3) cfg.seed   = parse_u64(argv[3], cfg.seed);

    std::cout << "Exactly-once test config:\n"
              << "  items   = " << cfg.items << "\n"
              << "  trials  = " << cfg.trials << "\n"
              << "  seed    = " << cfg.seed << "\n";

    run_all<spsc::LockFree>(cfg, "lock-free");
    run_all<spsc::Spinlocked>(cfg, "spin-locked");

    std::cout << "PASS: exactly-once, no leak, no double release.\n";
    return 0;
}
