#include "warden/capability.h"

namespace warden {

const char* capability_kind_name(CapabilityKind k) {
    switch (k) {
        case CapabilityKind::LOG:   return "log";
        case CapabilityKind::HTTP:  return "http";
        case CapabilityKind::AUDIT: return "audit";
    }
    return "unknown";
}

std::optional<CapabilityKind> capability_for_action(const std::string& action) {
    if (action == "log") return CapabilityKind::LOG;
    if (action == "http") return CapabilityKind::HTTP;
    if (action == "audit") return CapabilityKind::AUDIT;
    return std::nullopt;
}

} // namespace warden
