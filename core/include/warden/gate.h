#pragma once

// Warden PolicyGate: the only way to obtain an Authorized context.
//
//   StaticAuthorizationProvider authz;
//   auto result = PolicyGate(meta, authz)
//                     .require(PolicyRequirement::authenticated())
//                     .require(PolicyRequirement::authorized_for("log"))
//                     .build();
//
// require() keeps the list free of structural duplicates, so adding a
// requirement twice is a no-op. build() evaluates every distinct
// requirement, batches all failures, and on success walks the context
// through authenticate -> authorize, minting exactly the capability kinds
// implied by the satisfied actions.
//
// Single writer, single use: build() consumes the gate.

#include "authz.h"
#include "context.h"
#include "policy.h"
#include "request.h"

#include <variant>
#include <vector>

namespace warden {

using GateResult = std::variant<ExecutionContext<Authorized>, std::vector<Violation>>;

class PolicyGate {
public:
    // `authz` must outlive the gate.
    PolicyGate(RequestMetadata meta, const AuthorizationProvider& authz);

    PolicyGate(const PolicyGate&) = delete;
    PolicyGate& operator=(const PolicyGate&) = delete;
    // The moved-from gate counts as built.
    PolicyGate(PolicyGate&& other) noexcept;
    PolicyGate& operator=(PolicyGate&& other) noexcept;

    PolicyGate& require(PolicyRequirement req) &;
    PolicyGate&& require(PolicyRequirement req) &&;

    const std::vector<PolicyRequirement>& requirements() const { return requirements_; }
    const RequestMetadata& metadata() const { return meta_; }

    GateResult build() &&;

private:
    void add(PolicyRequirement req);

    RequestMetadata meta_;
    const AuthorizationProvider* authz_;
    std::vector<PolicyRequirement> requirements_;
    bool built_{false};
};

} // namespace warden
