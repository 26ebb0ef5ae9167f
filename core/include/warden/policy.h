#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace warden {

enum class RequirementKind : uint8_t {
    AUTHENTICATED,          // a principal must be present
    AUTHORIZED_FOR_ACTION,  // the provider must allow (principal, action)
};

// A named precondition accumulated by the PolicyGate.
// Compared structurally: same kind and same action name.
struct PolicyRequirement {
    RequirementKind kind{RequirementKind::AUTHENTICATED};
    std::string action;  // empty for AUTHENTICATED

    static PolicyRequirement authenticated();
    static PolicyRequirement authorized_for(std::string action);

    bool operator==(const PolicyRequirement&) const = default;

    // "authenticated" or "authorized_for(<action>)"
    std::string to_string() const;
};

// Action names: 1..64 bytes of [a-z0-9._-].
bool is_well_formed_action(const std::string& action);

enum class ViolationKind : uint8_t {
    MISSING_PRINCIPAL,
    POLICY_DENIED,
    MALFORMED,
};

const char* violation_kind_name(ViolationKind k);

struct Violation {
    ViolationKind kind{ViolationKind::MALFORMED};
    PolicyRequirement requirement;
    std::string message;  // safe text: no principal ids, no request data

    // "<kind> [<requirement>]: <message>"
    std::string to_string() const;
};

// Deterministic order (kind, then requirement text) so a batch does not
// depend on the order requirements were added.
void sort_violations(std::vector<Violation>* violations);

} // namespace warden
