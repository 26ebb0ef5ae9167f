#pragma once

// Warden capabilities: zero-payload, kind-tagged proof of authorization.
//
// A CapabilityToken<K> proves that some "authorized_for" requirement implying
// kind K was validated by the PolicyGate. It carries nothing else.
//
// Tokens cannot be constructed by user code: the constructor is private and
// the only factory (TokenIssuer::mint) is private too, reachable solely from
// the Authenticated -> Authorized transition.

#include "state.h"

#include <cstdint>
#include <optional>
#include <string>

namespace warden {

enum class CapabilityKind : uint8_t {
    LOG = 0,    // structured logging sink
    HTTP = 1,   // outbound network egress
    AUDIT = 2,  // audit trail writes
};

// "log", "http", "audit"
const char* capability_kind_name(CapabilityKind k);

// Maps an authorized action name to the capability it implies.
// Returns nullopt for actions that grant no capability.
std::optional<CapabilityKind> capability_for_action(const std::string& action);

class TokenIssuer;

template <CapabilityKind K>
class CapabilityToken {
public:
    static constexpr CapabilityKind kind = K;

private:
    CapabilityToken() = default;
    friend class TokenIssuer;
};

using LogToken = CapabilityToken<CapabilityKind::LOG>;
using HttpToken = CapabilityToken<CapabilityKind::HTTP>;
using AuditToken = CapabilityToken<CapabilityKind::AUDIT>;

// Type-erased view of a token, for sinks that check the kind at runtime.
// Only constructible from a real token, so it is exactly as unforgeable.
class CapabilityProof {
public:
    template <CapabilityKind K>
    CapabilityProof(const CapabilityToken<K>&) : kind_(K) {}

    CapabilityKind kind() const { return kind_; }

private:
    CapabilityKind kind_;
};

class TokenIssuer {
private:
    template <CapabilityKind K>
    static CapabilityToken<K> mint() { return CapabilityToken<K>(); }

    friend class ExecutionContext<Authenticated>;
};

} // namespace warden
