#pragma once

// Request-side types: who is asking, and the raw inputs they sent.
//
// BoundaryRequest is the reference boundary adapter. It collects the pieces
// of an incoming request and hands them to the core in exactly two forms:
// RequestMetadata (for the PolicyGate) and Untrusted<std::string> values
// (for the sanitizers). Raw parameters are never exposed any other way.

#include "untrusted.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden {

struct Principal {
    std::string id;
    std::string name;

    bool operator==(const Principal&) const = default;
};

struct RequestMetadata {
    std::string request_id;
    std::optional<Principal> principal;
};

enum class ParamSource : uint8_t { QUERY, HEADER, PATH };

const char* param_source_name(ParamSource s);

class BoundaryRequest {
public:
    explicit BoundaryRequest(std::string request_id = "");

    void set_principal(std::optional<Principal> principal);

    // Later values for the same (source, name) replace earlier ones.
    void add(ParamSource source, const std::string& name, std::string raw);

    const std::string& request_id() const { return request_id_; }
    const std::optional<Principal>& principal() const { return principal_; }

    RequestMetadata metadata() const;

    // Hands out a parameter once. Returns nullopt if absent or already taken.
    std::optional<Untrusted<std::string>> take(ParamSource source, const std::string& name);

    // Names still available from `source`, sorted.
    std::vector<std::string> names(ParamSource source) const;

    size_t pending() const;

private:
    std::map<std::string, std::string>& params_for(ParamSource source);
    const std::map<std::string, std::string>& params_for(ParamSource source) const;

    std::string request_id_;
    std::optional<Principal> principal_;
    std::map<std::string, std::string> query_;
    std::map<std::string, std::string> headers_;
    std::map<std::string, std::string> path_;
};

} // namespace warden
