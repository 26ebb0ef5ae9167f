#include "warden/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <cerrno>

namespace warden {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

Profile detect_profile() {
    const char* env = std::getenv("WARDEN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    setenv("WARDEN_AUDIT_LOG", "warden_audit.jsonl", NO_OVERWRITE);

    switch (p) {
        case Profile::DEV:
            setenv("WARDEN_MAX_INPUT_LEN",   "256", NO_OVERWRITE);
            setenv("WARDEN_ALLOW_WILDCARD",  "1",   NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("WARDEN_MAX_INPUT_LEN",   "128", NO_OVERWRITE);
            // Grants must name principals and actions explicitly
            setenv("WARDEN_ALLOW_WILDCARD",  "0",   NO_OVERWRITE);
            break;
    }
}

static bool parse_bool(const std::string& raw, bool* out) {
    std::string v = lower(raw);
    if (v == "1" || v == "true" || v == "yes" || v == "on") { *out = true; return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { *out = false; return true; }
    return false;
}

static bool parse_size(const std::string& raw, size_t* out) {
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    errno = 0;
    unsigned long long v = std::strtoull(raw.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    *out = static_cast<size_t>(v);
    return true;
}

std::string load_runtime_config(RuntimeConfig* out) {
    if (!out) return "null config";

    RuntimeConfig cfg;
    cfg.profile = detect_profile();

    if (const char* v = std::getenv("WARDEN_MAX_INPUT_LEN")) {
        if (!parse_size(v, &cfg.max_input_len)) return "WARDEN_MAX_INPUT_LEN: expected a non-negative integer";
    }
    if (const char* v = std::getenv("WARDEN_AUDIT_LOG")) {
        if (!*v) return "WARDEN_AUDIT_LOG: must not be empty";
        cfg.audit_log_path = v;
    }
    if (const char* v = std::getenv("WARDEN_ALLOW_WILDCARD")) {
        if (!parse_bool(v, &cfg.allow_wildcard)) return "WARDEN_ALLOW_WILDCARD: expected 0 or 1";
    }

    *out = std::move(cfg);
    return "";
}

} // namespace warden
