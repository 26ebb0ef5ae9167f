#include "warden/context.h"

#include <stdexcept>

namespace warden {

// --- Authorized ---

bool ExecutionContext<Authorized>::has_capability(CapabilityKind k) const {
    switch (k) {
        case CapabilityKind::LOG:   return log_.has_value();
        case CapabilityKind::HTTP:  return http_.has_value();
        case CapabilityKind::AUDIT: return audit_.has_value();
    }
    return false;
}

std::vector<CapabilityKind> ExecutionContext<Authorized>::granted() const {
    std::vector<CapabilityKind> out;
    for (auto k : {CapabilityKind::LOG, CapabilityKind::HTTP, CapabilityKind::AUDIT}) {
        if (has_capability(k)) out.push_back(k);
    }
    return out;
}

// --- Authenticated ---

ExecutionContext<Authenticated>::ExecutionContext(ExecutionContext&& other) noexcept
    : request_id_(std::move(other.request_id_)),
      principal_(std::move(other.principal_)),
      consumed_(other.consumed_) {
    other.consumed_ = true;
}

ExecutionContext<Authenticated>& ExecutionContext<Authenticated>::operator=(ExecutionContext&& other) noexcept {
    if (this != &other) {
        request_id_ = std::move(other.request_id_);
        principal_ = std::move(other.principal_);
        consumed_ = other.consumed_;
        other.consumed_ = true;
    }
    return *this;
}

ExecutionContext<Authorized> ExecutionContext<Authenticated>::authorize(const std::set<CapabilityKind>& kinds) && {
    // Only the PolicyGate gets here; a consumed context means the gate's
    // own bookkeeping is broken.
    if (consumed_) throw std::logic_error("authorize called on a consumed context");
    consumed_ = true;

    ExecutionContext<Authorized> next(std::move(request_id_), std::move(principal_));
    for (CapabilityKind k : kinds) {
        switch (k) {
            case CapabilityKind::LOG:   next.log_ = TokenIssuer::mint<CapabilityKind::LOG>(); break;
            case CapabilityKind::HTTP:  next.http_ = TokenIssuer::mint<CapabilityKind::HTTP>(); break;
            case CapabilityKind::AUDIT: next.audit_ = TokenIssuer::mint<CapabilityKind::AUDIT>(); break;
        }
    }
    return next;
}

// --- Unauthenticated ---

ExecutionContext<Unauthenticated>::ExecutionContext(ExecutionContext&& other) noexcept
    : request_id_(std::move(other.request_id_)), consumed_(other.consumed_) {
    other.consumed_ = true;
}

ExecutionContext<Unauthenticated>& ExecutionContext<Unauthenticated>::operator=(ExecutionContext&& other) noexcept {
    if (this != &other) {
        request_id_ = std::move(other.request_id_);
        consumed_ = other.consumed_;
        other.consumed_ = true;
    }
    return *this;
}

AuthenticateResult ExecutionContext<Unauthenticated>::authenticate(std::optional<Principal> principal) && {
    if (consumed_) {
        return Violation{ViolationKind::MALFORMED, PolicyRequirement::authenticated(),
                         "context was already consumed"};
    }
    consumed_ = true;

    if (!principal) {
        return Violation{ViolationKind::MISSING_PRINCIPAL, PolicyRequirement::authenticated(),
                         "authentication required"};
    }

    ExecutionContext<Authenticated> next(std::move(request_id_), std::move(*principal));
    return AuthenticateResult(std::move(next));
}

} // namespace warden
