#include "warden/sanitizer.h"

namespace warden {

static bool is_ascii_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static bool is_control_byte(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

const char* sanitization_error_kind_name(SanitizationErrorKind k) {
    switch (k) {
        case SanitizationErrorKind::EMPTY:             return "empty input";
        case SanitizationErrorKind::TOO_LONG:          return "input too long";
        case SanitizationErrorKind::INVALID_CHARACTER: return "invalid character";
        case SanitizationErrorKind::CUSTOM:            return "rejected";
        case SanitizationErrorKind::CONSUMED:          return "already consumed";
    }
    return "unknown";
}

SanitizationError SanitizationError::empty() {
    return {SanitizationErrorKind::EMPTY, "input is empty or contains only whitespace", std::nullopt, std::nullopt};
}

SanitizationError SanitizationError::too_long(size_t max_len) {
    return {SanitizationErrorKind::TOO_LONG,
            "input exceeds maximum length of " + std::to_string(max_len),
            std::nullopt, max_len};
}

SanitizationError SanitizationError::invalid_character(size_t position) {
    return {SanitizationErrorKind::INVALID_CHARACTER,
            "control character at offset " + std::to_string(position),
            position, std::nullopt};
}

SanitizationError SanitizationError::custom(std::string detail) {
    return {SanitizationErrorKind::CUSTOM, std::move(detail), std::nullopt, std::nullopt};
}

SanitizationError SanitizationError::consumed() {
    return {SanitizationErrorKind::CONSUMED, "untrusted value was already consumed", std::nullopt, std::nullopt};
}

std::string SanitizationError::to_string() const {
    return std::string("sanitization failed (") + sanitization_error_kind_name(kind) + "): " + detail;
}

SanitizeResult<std::string> StringSanitizer::check(std::string raw) const {
    size_t begin = 0;
    size_t end = raw.size();
    while (begin < end && is_ascii_space(static_cast<unsigned char>(raw[begin]))) begin++;
    while (end > begin && is_ascii_space(static_cast<unsigned char>(raw[end - 1]))) end--;

    if (begin == end) return SanitizationError::empty();

    // Order matters: a value that is both too long and dirty reports the
    // character first.
    for (size_t i = begin; i < end; i++) {
        if (is_control_byte(static_cast<unsigned char>(raw[i]))) {
            return SanitizationError::invalid_character(i - begin);
        }
    }

    if (end - begin > max_len_) return SanitizationError::too_long(max_len_);

    raw.erase(end);
    raw.erase(0, begin);
    return accept(std::move(raw));
}

SanitizeResult<std::string> sanitize(Untrusted<std::string> input, const StringSanitizerConfig& cfg) {
    return StringSanitizer(cfg).sanitize(std::move(input));
}

} // namespace warden
