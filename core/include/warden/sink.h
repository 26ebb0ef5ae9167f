#pragma once

// Warden sink contract.
//
// A sink is any operation with an externally observable side effect. It
// accepts only a VerifiedValue<T> and a capability of the kind it declares.
//
//   Sink<T, K>      kind fixed at compile time; consume() takes a
//                   CapabilityToken<K>, so a token of another kind does not
//                   compile.
//   RuntimeSink<T>  kind chosen at construction; consume() takes a
//                   CapabilityProof and reports CAPABILITY_MISMATCH.
//
// Each consume() performs exactly one write. Errors from the concrete sink
// are returned unchanged; the core never retries.

#include "capability.h"
#include "verified.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

enum class SinkErrorKind : uint8_t {
    TRANSPORT,            // I/O failed underneath the sink
    REJECTED,             // the sink refused the value
    UNAVAILABLE,          // sink closed, full, or not configured
    CAPABILITY_MISMATCH,  // token kind differs from the sink's kind
};

const char* sink_error_kind_name(SinkErrorKind k);

struct SinkError {
    SinkErrorKind kind{SinkErrorKind::REJECTED};
    std::string message;

    // "sink error (<kind>)" or "sink error (<kind>): <message>"
    std::string to_string() const;
};

template <typename T, CapabilityKind K>
class Sink {
public:
    virtual ~Sink() = default;

    CapabilityKind required_capability() const { return K; }

    // Returns nullopt on success.
    std::optional<SinkError> consume(const CapabilityToken<K>&, const VerifiedValue<T>& value) {
        return write(value);
    }

protected:
    virtual std::optional<SinkError> write(const VerifiedValue<T>& value) = 0;
};

template <typename T>
class RuntimeSink {
public:
    virtual ~RuntimeSink() = default;

    virtual CapabilityKind required_capability() const = 0;

    // Returns nullopt on success.
    std::optional<SinkError> consume(const CapabilityProof& proof, const VerifiedValue<T>& value) {
        if (proof.kind() != required_capability()) {
            return SinkError{SinkErrorKind::CAPABILITY_MISMATCH,
                             std::string("expected ") + capability_kind_name(required_capability()) +
                             " capability, got " + capability_kind_name(proof.kind())};
        }
        return write(value);
    }

protected:
    virtual std::optional<SinkError> write(const VerifiedValue<T>& value) = 0;
};

// In-memory reference sink: appends each consumed value to an ordered record.
// Optional capacity bound; a full sink reports UNAVAILABLE.
class MemorySink : public RuntimeSink<std::string> {
public:
    explicit MemorySink(CapabilityKind required = CapabilityKind::LOG, size_t capacity = 0)
        : required_(required), capacity_(capacity) {}

    CapabilityKind required_capability() const override { return required_; }

    std::vector<std::string> values() const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

protected:
    std::optional<SinkError> write(const VerifiedValue<std::string>& value) override;

private:
    CapabilityKind required_;
    size_t capacity_;  // 0 = unbounded
    mutable std::mutex mu_;
    std::vector<std::string> values_;
};

} // namespace warden
