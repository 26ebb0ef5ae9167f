#include "warden/sink.h"

namespace warden {

const char* sink_error_kind_name(SinkErrorKind k) {
    switch (k) {
        case SinkErrorKind::TRANSPORT:           return "transport";
        case SinkErrorKind::REJECTED:            return "rejected";
        case SinkErrorKind::UNAVAILABLE:         return "unavailable";
        case SinkErrorKind::CAPABILITY_MISMATCH: return "capability mismatch";
    }
    return "unknown";
}

std::string SinkError::to_string() const {
    std::string out = std::string("sink error (") + sink_error_kind_name(kind) + ")";
    if (!message.empty()) out += ": " + message;
    return out;
}

// --- MemorySink ---

std::optional<SinkError> MemorySink::write(const VerifiedValue<std::string>& value) {
    std::lock_guard<std::mutex> lk(mu_);
    if (capacity_ > 0 && values_.size() >= capacity_) {
        return SinkError{SinkErrorKind::UNAVAILABLE, "sink full"};
    }
    values_.push_back(value.get());
    return std::nullopt;
}

std::vector<std::string> MemorySink::values() const {
    std::lock_guard<std::mutex> lk(mu_);
    return values_;
}

size_t MemorySink::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return values_.size();
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    values_.clear();
}

} // namespace warden
