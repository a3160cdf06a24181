#pragma once
#include <new>
#include <type_traits>
#include <utility>

namespace spsc {

// Tagged cell (occupied or empty):
//  - construct() only on an empty slot, by the producer, before it publishes
//    the write cursor that covers this slot
//  - move_out_and_destroy() only on an occupied slot, by the consumer, before
//    it publishes the read cursor that frees this slot
//  - reset() destroys whatever is left; called from ~Slot, which is how
//    values sent but never received are released at teardown
//
// `occupied_` is plain data: ownership of the whole cell moves between the two
// sides through the cursor publication, never concurrently.

template <class T>
class Slot {
public:
    Slot() = default;
    ~Slot() { reset(); }

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

    template <class U>
    void construct(U&& value) {
        new (&storage_) T(std::forward<U>(value));
        occupied_ = true;
    }

    // If T's move constructor throws, the slot stays occupied and untouched.
    template <class Out>
    void move_out_and_destroy(Out& out) {
        T* p = ptr();
        out.emplace(std::move(*p));
        p->~T();
        occupied_ = false;
    }

    void reset() noexcept {
        if (occupied_) {
            ptr()->~T();
            occupied_ = false;
        }
    }

private:
    T* ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }

    std::aligned_storage_t<sizeof(T), alignof(T)> storage_;
    bool occupied_ = false;
};

} // namespace spsc
