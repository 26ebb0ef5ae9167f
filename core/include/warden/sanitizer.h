#pragma once

// Warden sanitization pipeline.
//
// Untrusted<T> --Sanitizer<T>::sanitize--> VerifiedValue<T> | SanitizationError
//
// Sanitizers are pure: the result depends only on the input and the
// sanitizer's configuration. Error details are written by the sanitizer and
// must never echo the rejected value (or any substring of it).

#include "untrusted.h"
#include "verified.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace warden {

enum class SanitizationErrorKind : uint8_t {
    EMPTY,              // nothing left after trimming
    TOO_LONG,           // exceeds the configured limit
    INVALID_CHARACTER,  // C0 control byte or DEL
    CUSTOM,             // rejected by a caller-supplied validator
    CONSUMED,           // the untrusted value was already handed out
};

const char* sanitization_error_kind_name(SanitizationErrorKind k);

struct SanitizationError {
    SanitizationErrorKind kind{SanitizationErrorKind::CUSTOM};
    std::string detail;              // safe text, never contains input
    std::optional<size_t> position;  // INVALID_CHARACTER: offset in the trimmed value
    std::optional<size_t> limit;     // TOO_LONG: configured maximum

    static SanitizationError empty();
    static SanitizationError too_long(size_t max_len);
    static SanitizationError invalid_character(size_t position);
    static SanitizationError custom(std::string detail);
    static SanitizationError consumed();

    // "sanitization failed (<kind>): <detail>"
    std::string to_string() const;
};

template <typename T>
using SanitizeResult = std::variant<VerifiedValue<T>, SanitizationError>;

// Base of every validator. Subclasses implement check() and build verified
// values with accept(); nothing else can construct a VerifiedValue<T>.
template <typename T>
class Sanitizer {
public:
    virtual ~Sanitizer() = default;

    SanitizeResult<T> sanitize(Untrusted<T> input) const {
        if (input.consumed()) return SanitizationError::consumed();
        return check(std::move(input).release());
    }

protected:
    virtual SanitizeResult<T> check(T raw) const = 0;

    static VerifiedValue<T> accept(T value) { return VerifiedValue<T>(std::move(value)); }
};

struct StringSanitizerConfig {
    size_t max_len{256};  // bytes, measured after trimming
};

// Reference string validator:
//   1. trim ASCII whitespace (space, \t, \n, \v, \f, \r) at both ends
//   2. EMPTY if nothing is left
//   3. INVALID_CHARACTER at the first byte in 0x00-0x1F or 0x7F
//   4. TOO_LONG if the trimmed length exceeds max_len
// Bytes >= 0x80 are passed through untouched (UTF-8 is not decoded).
class StringSanitizer : public Sanitizer<std::string> {
public:
    explicit StringSanitizer(size_t max_len = 256) : max_len_(max_len) {}
    explicit StringSanitizer(const StringSanitizerConfig& cfg) : max_len_(cfg.max_len) {}

    size_t max_len() const { return max_len_; }

protected:
    SanitizeResult<std::string> check(std::string raw) const override;

private:
    size_t max_len_;
};

SanitizeResult<std::string> sanitize(Untrusted<std::string> input, const StringSanitizerConfig& cfg);

// Validator built from a predicate. `detail` is reported on rejection and
// must be a fixed description, not derived from the value.
template <typename T>
class PredicateSanitizer : public Sanitizer<T> {
public:
    using Predicate = std::function<bool(const T&)>;

    PredicateSanitizer(Predicate pred, std::string detail)
        : pred_(std::move(pred)), detail_(std::move(detail)) {}

protected:
    SanitizeResult<T> check(T raw) const override {
        if (!pred_ || !pred_(raw)) return SanitizationError::custom(detail_);
        return Sanitizer<T>::accept(std::move(raw));
    }

private:
    Predicate pred_;
    std::string detail_;
};

// Accepts everything. For tests and for values already validated upstream.
template <typename T>
class PassthroughSanitizer : public Sanitizer<T> {
protected:
    SanitizeResult<T> check(T raw) const override {
        return Sanitizer<T>::accept(std::move(raw));
    }
};

template <typename T>
class RejectAllSanitizer : public Sanitizer<T> {
protected:
    SanitizeResult<T> check(T) const override {
        return SanitizationError::custom("rejected by policy");
    }
};

} // namespace warden
