#pragma once
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace spsc {

// The consumer is gone; the value comes back to the caller untouched.
template <class T>
struct SendError {
    T value;
};

// The producer is gone and nothing is left to receive.
struct RecvError {};

// Value-or-error returned by send/recv. Reading the alternative that is not
// held throws (std::bad_variant_access, std::bad_optional_access for void).
template <class T, class E>
class Result {
public:
    Result(T value) : v_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : v_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return v_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    // Replaces whatever is held with a value built in place.
    template <class... Args>
    T& emplace(Args&&... args) {
        return v_.template emplace<0>(std::forward<Args>(args)...);
    }

    T&       value() &       { return std::get<0>(v_); }
    const T& value() const & { return std::get<0>(v_); }
    T&&      value() &&      { return std::get<0>(std::move(v_)); }

    E&       error() &       { return std::get<1>(v_); }
    const E& error() const & { return std::get<1>(v_); }
    E&&      error() &&      { return std::get<1>(std::move(v_)); }

    template <class U>
    T value_or(U&& fallback) && {
        if (ok()) return std::get<0>(std::move(v_));
        return static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, E> v_;
};

// Success carries nothing.
template <class E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : err_(std::move(error)) {}

    bool ok() const noexcept { return !err_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    E&       error() &       { return err_.value(); }
    const E& error() const & { return err_.value(); }
    E&&      error() &&      { return std::move(err_).value(); }

private:
    std::optional<E> err_;
};

template <class T>
using SendResult = Result<void, SendError<T>>;

template <class T>
using RecvResult = Result<T, RecvError>;

} // namespace spsc
