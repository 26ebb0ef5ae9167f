#pragma once

// Warden execution context: a three-state type-state machine.
//
//   ExecutionContext<Unauthenticated>   request_id(), authenticate()
//   ExecutionContext<Authenticated>     request_id(), principal()
//   ExecutionContext<Authorized>        request_id(), principal(), log()/http()/audit()
//
// Transitions are rvalue-qualified and consume the previous context:
//
//   auto r = std::move(unauth).authenticate(principal);
//
// authorize() is private to the PolicyGate, which calls it only after every
// requirement validated. An Authorized context always holds a principal and
// exactly the tokens the gate decided to mint.

#include "capability.h"
#include "policy.h"
#include "request.h"
#include "state.h"

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace warden {

class PolicyGate;

template <>
class ExecutionContext<Authorized> {
public:
    const std::string& request_id() const { return request_id_; }
    const Principal& principal() const { return principal_; }

    // Present iff the kind was granted.
    std::optional<LogToken> log() const { return log_; }
    std::optional<HttpToken> http() const { return http_; }
    std::optional<AuditToken> audit() const { return audit_; }

    template <CapabilityKind K>
    std::optional<CapabilityToken<K>> capability() const {
        if constexpr (K == CapabilityKind::LOG) return log_;
        else if constexpr (K == CapabilityKind::HTTP) return http_;
        else return audit_;
    }

    bool has_capability(CapabilityKind k) const;

    // Granted kinds in enum order.
    std::vector<CapabilityKind> granted() const;

private:
    ExecutionContext(std::string request_id, Principal principal)
        : request_id_(std::move(request_id)), principal_(std::move(principal)) {}

    std::string request_id_;
    Principal principal_;
    std::optional<LogToken> log_;
    std::optional<HttpToken> http_;
    std::optional<AuditToken> audit_;

    friend class ExecutionContext<Authenticated>;
};

template <>
class ExecutionContext<Authenticated> {
public:
    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;
    ExecutionContext(ExecutionContext&& other) noexcept;
    ExecutionContext& operator=(ExecutionContext&& other) noexcept;

    const std::string& request_id() const { return request_id_; }
    const Principal& principal() const { return principal_; }

private:
    ExecutionContext(std::string request_id, Principal principal)
        : request_id_(std::move(request_id)), principal_(std::move(principal)) {}

    // Mints one token per kind. Throws std::logic_error on a consumed context.
    ExecutionContext<Authorized> authorize(const std::set<CapabilityKind>& kinds) &&;

    std::string request_id_;
    Principal principal_;
    bool consumed_{false};

    friend class ExecutionContext<Unauthenticated>;
    friend class PolicyGate;
};

using AuthenticateResult = std::variant<ExecutionContext<Authenticated>, Violation>;

template <>
class ExecutionContext<Unauthenticated> {
public:
    explicit ExecutionContext(std::string request_id) : request_id_(std::move(request_id)) {}

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;
    ExecutionContext(ExecutionContext&& other) noexcept;
    ExecutionContext& operator=(ExecutionContext&& other) noexcept;

    const std::string& request_id() const { return request_id_; }

    // MISSING_PRINCIPAL if `principal` is absent, MALFORMED if this context
    // was already consumed.
    AuthenticateResult authenticate(std::optional<Principal> principal) &&;

private:
    std::string request_id_;
    bool consumed_{false};
};

using UnauthenticatedContext = ExecutionContext<Unauthenticated>;
using AuthenticatedContext = ExecutionContext<Authenticated>;
using AuthorizedContext = ExecutionContext<Authorized>;

} // namespace warden
