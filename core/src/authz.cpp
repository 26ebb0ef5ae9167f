#include "warden/authz.h"

namespace warden {

static const std::string kWildcard = "*";

void StaticAuthorizationProvider::grant(const std::string& principal_id, const std::string& action) {
    grants_[principal_id].insert(action);
}

void StaticAuthorizationProvider::revoke(const std::string& principal_id, const std::string& action) {
    auto it = grants_.find(principal_id);
    if (it == grants_.end()) return;
    it->second.erase(action);
    if (it->second.empty()) grants_.erase(it);
}

size_t StaticAuthorizationProvider::grant_count() const {
    size_t n = 0;
    for (const auto& kv : grants_) n += kv.second.size();
    return n;
}

bool StaticAuthorizationProvider::has(const std::string& principal_id, const std::string& action) const {
    auto it = grants_.find(principal_id);
    if (it == grants_.end()) return false;
    if (it->second.count(action)) return true;
    return allow_wildcard_ && it->second.count(kWildcard) > 0;
}

bool StaticAuthorizationProvider::decide(const Principal& principal, const std::string& action) const {
    if (principal.id.empty()) return false;
    if (has(principal.id, action)) return true;
    return allow_wildcard_ && has(kWildcard, action);
}

} // namespace warden
