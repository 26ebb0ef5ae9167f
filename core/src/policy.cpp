#include "warden/policy.h"

#include <algorithm>
#include <tuple>

namespace warden {

static constexpr size_t kMaxActionLen = 64;

PolicyRequirement PolicyRequirement::authenticated() {
    return PolicyRequirement{RequirementKind::AUTHENTICATED, ""};
}

PolicyRequirement PolicyRequirement::authorized_for(std::string action) {
    return PolicyRequirement{RequirementKind::AUTHORIZED_FOR_ACTION, std::move(action)};
}

std::string PolicyRequirement::to_string() const {
    if (kind == RequirementKind::AUTHENTICATED) return "authenticated";
    return "authorized_for(" + action + ")";
}

bool is_well_formed_action(const std::string& action) {
    if (action.empty() || action.size() > kMaxActionLen) return false;
    for (char c : action) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

const char* violation_kind_name(ViolationKind k) {
    switch (k) {
        case ViolationKind::MISSING_PRINCIPAL: return "missing_principal";
        case ViolationKind::POLICY_DENIED:     return "policy_denied";
        case ViolationKind::MALFORMED:         return "malformed";
    }
    return "unknown";
}

std::string Violation::to_string() const {
    return std::string(violation_kind_name(kind)) + " [" + requirement.to_string() + "]: " + message;
}

void sort_violations(std::vector<Violation>* violations) {
    if (!violations) return;
    std::stable_sort(violations->begin(), violations->end(), [](const Violation& a, const Violation& b) {
        return std::make_tuple(static_cast<int>(a.kind), static_cast<int>(a.requirement.kind), a.requirement.action) <
               std::make_tuple(static_cast<int>(b.kind), static_cast<int>(b.requirement.kind), b.requirement.action);
    });
}

} // namespace warden
