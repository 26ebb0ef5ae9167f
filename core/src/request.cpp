#include "warden/request.h"

#include <algorithm>
#include <cctype>

namespace warden {

const char* param_source_name(ParamSource s) {
    switch (s) {
        case ParamSource::QUERY:  return "query";
        case ParamSource::HEADER: return "header";
        case ParamSource::PATH:   return "path";
    }
    return "unknown";
}

BoundaryRequest::BoundaryRequest(std::string request_id) : request_id_(std::move(request_id)) {}

void BoundaryRequest::set_principal(std::optional<Principal> principal) {
    principal_ = std::move(principal);
}

void BoundaryRequest::add(ParamSource source, const std::string& name, std::string raw) {
    std::string key = name;
    // Header names are case-insensitive
    if (source == ParamSource::HEADER) {
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });
    }
    params_for(source)[key] = std::move(raw);
}

RequestMetadata BoundaryRequest::metadata() const {
    return RequestMetadata{request_id_, principal_};
}

std::optional<Untrusted<std::string>> BoundaryRequest::take(ParamSource source, const std::string& name) {
    std::string key = name;
    if (source == ParamSource::HEADER) {
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });
    }
    auto& params = params_for(source);
    auto it = params.find(key);
    if (it == params.end()) return std::nullopt;
    Untrusted<std::string> out(std::move(it->second));
    params.erase(it);
    return std::optional<Untrusted<std::string>>(std::move(out));
}

std::vector<std::string> BoundaryRequest::names(ParamSource source) const {
    std::vector<std::string> out;
    for (const auto& kv : params_for(source)) out.push_back(kv.first);
    return out;
}

size_t BoundaryRequest::pending() const {
    return query_.size() + headers_.size() + path_.size();
}

std::map<std::string, std::string>& BoundaryRequest::params_for(ParamSource source) {
    switch (source) {
        case ParamSource::HEADER: return headers_;
        case ParamSource::PATH:   return path_;
        case ParamSource::QUERY:  break;
    }
    return query_;
}

const std::map<std::string, std::string>& BoundaryRequest::params_for(ParamSource source) const {
    switch (source) {
        case ParamSource::HEADER: return headers_;
        case ParamSource::PATH:   return path_;
        case ParamSource::QUERY:  break;
    }
    return query_;
}

} // namespace warden
