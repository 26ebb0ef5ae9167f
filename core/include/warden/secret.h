#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace warden {

inline constexpr const char* kRedacted = "[REDACTED]";

// Holds a sensitive value. Streaming it prints "[REDACTED]"; the value is
// reachable only through expose().
template <typename T>
class Secret {
public:
    explicit Secret(T value) : value_(std::move(value)) {}

    const T& expose() const { return value_; }

private:
    T value_;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Secret<T>&) {
    return os << kRedacted;
}

// Strips userinfo and replaces any query string or fragment:
//   https://u:pw@host/p?token=x#f  ->  https://host/p?[REDACTED]
std::string redact_url(const std::string& url);

} // namespace warden
