#pragma once

#include <type_traits>
#include <utility>

namespace warden {

template <typename T>
class Sanitizer;

// Raw data from an unverified external source.
//
// There is no accessor: the only way to reach the value is to hand the
// wrapper to a Sanitizer<T>, which consumes it. The wrapper is move-only and
// a moved-from wrapper is marked consumed, so the same input cannot be
// sanitized twice.
template <typename T>
class Untrusted {
public:
    explicit Untrusted(T value) : value_(std::move(value)) {}

    Untrusted(const Untrusted&) = delete;
    Untrusted& operator=(const Untrusted&) = delete;

    Untrusted(Untrusted&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(other.value_)), consumed_(other.consumed_) {
        other.consumed_ = true;
    }

    Untrusted& operator=(Untrusted&& other) noexcept(std::is_nothrow_move_assignable_v<T>) {
        if (this != &other) {
            value_ = std::move(other.value_);
            consumed_ = other.consumed_;
            other.consumed_ = true;
        }
        return *this;
    }

    bool consumed() const { return consumed_; }

private:
    T release() && {
        consumed_ = true;
        return std::move(value_);
    }

    T value_;
    bool consumed_{false};

    friend class Sanitizer<T>;
};

} // namespace warden
