#pragma once
#include <cstddef>
#include <string>

namespace warden {

enum class Profile { DEV, PROD };

// Detect profile from WARDEN_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (256-byte inputs, "*" grants honored)
// PROD: strict (128-byte inputs, "*" grants ignored)
void apply_profile_defaults(Profile p);

struct RuntimeConfig {
    Profile profile{Profile::DEV};
    size_t max_input_len{256};
    std::string audit_log_path{"warden_audit.jsonl"};
    bool allow_wildcard{true};
};

// Reads WARDEN_PROFILE, WARDEN_MAX_INPUT_LEN, WARDEN_AUDIT_LOG and
// WARDEN_ALLOW_WILDCARD. Unset variables keep their defaults.
// Returns empty string on success, otherwise names the bad variable;
// `out` is left untouched on error.
std::string load_runtime_config(RuntimeConfig* out);

} // namespace warden
