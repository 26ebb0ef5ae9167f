#pragma once

// Authorization decision providers.
//
// The PolicyGate never decides allow/deny itself: for each distinct
// "authorized_for(action)" requirement it asks the provider exactly once,
// keyed by (principal, action). Providers must be safe to call from const
// context; grant tables are expected to be frozen before use.

#include "request.h"

#include <functional>
#include <map>
#include <set>
#include <string>

namespace warden {

class AuthorizationProvider {
public:
    virtual ~AuthorizationProvider() = default;
    virtual bool decide(const Principal& principal, const std::string& action) const = 0;
};

// Grant table keyed by principal id. "*" as principal id or action acts as
// a wildcard when wildcards are enabled (see WARDEN_ALLOW_WILDCARD).
class StaticAuthorizationProvider : public AuthorizationProvider {
public:
    void grant(const std::string& principal_id, const std::string& action);
    void revoke(const std::string& principal_id, const std::string& action);

    void set_allow_wildcard(bool enable) { allow_wildcard_ = enable; }
    bool allow_wildcard() const { return allow_wildcard_; }

    size_t grant_count() const;

    bool decide(const Principal& principal, const std::string& action) const override;

private:
    bool has(const std::string& principal_id, const std::string& action) const;

    std::map<std::string, std::set<std::string>> grants_;
    bool allow_wildcard_{true};
};

class FunctionAuthorizationProvider : public AuthorizationProvider {
public:
    using DecideFn = std::function<bool(const Principal&, const std::string&)>;

    explicit FunctionAuthorizationProvider(DecideFn fn) : fn_(std::move(fn)) {}

    bool decide(const Principal& principal, const std::string& action) const override {
        return fn_ ? fn_(principal, action) : false;
    }

private:
    DecideFn fn_;
};

} // namespace warden
