#pragma once

#include <utility>

namespace warden {

template <typename T>
class Sanitizer;

// Data that passed an explicit sanitizer.
//
// Construction is private to Sanitizer<T>: a VerifiedValue<T> exists only if
// some sanitize() call succeeded. Immutable once built.
template <typename T>
class VerifiedValue {
public:
    const T& get() const { return value_; }
    const T& operator*() const { return value_; }
    const T* operator->() const { return &value_; }

    T into_inner() && { return std::move(value_); }

private:
    explicit VerifiedValue(T value) : value_(std::move(value)) {}

    T value_;

    friend class Sanitizer<T>;
};

} // namespace warden
