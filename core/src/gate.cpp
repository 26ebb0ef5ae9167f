#include "warden/gate.h"

namespace warden {

PolicyGate::PolicyGate(RequestMetadata meta, const AuthorizationProvider& authz)
    : meta_(std::move(meta)), authz_(&authz) {}

PolicyGate::PolicyGate(PolicyGate&& other) noexcept
    : meta_(std::move(other.meta_)),
      authz_(other.authz_),
      requirements_(std::move(other.requirements_)),
      built_(other.built_) {
    other.built_ = true;
}

PolicyGate& PolicyGate::operator=(PolicyGate&& other) noexcept {
    if (this != &other) {
        meta_ = std::move(other.meta_);
        authz_ = other.authz_;
        requirements_ = std::move(other.requirements_);
        built_ = other.built_;
        other.built_ = true;
    }
    return *this;
}

void PolicyGate::add(PolicyRequirement req) {
    for (const auto& r : requirements_) {
        if (r == req) return;
    }
    requirements_.push_back(std::move(req));
}

PolicyGate& PolicyGate::require(PolicyRequirement req) & {
    add(std::move(req));
    return *this;
}

PolicyGate&& PolicyGate::require(PolicyRequirement req) && {
    add(std::move(req));
    return std::move(*this);
}

GateResult PolicyGate::build() && {
    if (built_) {
        return std::vector<Violation>{
            Violation{ViolationKind::MALFORMED, PolicyRequirement::authenticated(), "policy gate was already built"}};
    }
    built_ = true;

    std::vector<Violation> violations;
    std::set<CapabilityKind> kinds;
    const bool has_principal = meta_.principal.has_value();

    for (const auto& req : requirements_) {
        if (req.kind == RequirementKind::AUTHENTICATED) continue;  // covered below

        if (!is_well_formed_action(req.action)) {
            violations.push_back({ViolationKind::MALFORMED, req, "action name is empty or malformed"});
            continue;
        }
        // Without a principal there is nothing to ask the provider about;
        // the single MISSING_PRINCIPAL below covers this requirement.
        if (!has_principal) continue;

        if (!authz_->decide(*meta_.principal, req.action)) {
            violations.push_back({ViolationKind::POLICY_DENIED, req,
                                  "principal is not authorized for action '" + req.action + "'"});
            continue;
        }
        if (auto k = capability_for_action(req.action)) kinds.insert(*k);
    }

    // An Authorized context always carries a principal, so its absence is a
    // violation even when no requirement asked for authentication.
    if (!has_principal) {
        violations.push_back({ViolationKind::MISSING_PRINCIPAL, PolicyRequirement::authenticated(),
                              "authentication required"});
    }

    if (!violations.empty()) {
        sort_violations(&violations);
        return violations;
    }

    ExecutionContext<Unauthenticated> ctx(std::move(meta_.request_id));
    AuthenticateResult authed = std::move(ctx).authenticate(std::move(meta_.principal));
    if (auto* v = std::get_if<Violation>(&authed)) {
        return std::vector<Violation>{std::move(*v)};
    }
    return std::move(std::get<ExecutionContext<Authenticated>>(authed)).authorize(kinds);
}

} // namespace warden
