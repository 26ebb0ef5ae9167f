#include "warden/serialization.h"

namespace warden {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

std::string json_to_string(json_object* o) {
    if (!o) return "null";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

static json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

// --- Outcome serialization ---

json_object* requirement_to_json(const PolicyRequirement& r) {
    json_object* o = json_object_new_object();
    if (r.kind == RequirementKind::AUTHENTICATED) {
        json_object_object_add(o, "kind", json_object_new_string("authenticated"));
    } else {
        json_object_object_add(o, "kind", json_object_new_string("authorized_for_action"));
        json_object_object_add(o, "action", new_string(r.action));
    }
    return o;
}

json_object* violation_to_json(const Violation& v) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "kind", json_object_new_string(violation_kind_name(v.kind)));
    json_object_object_add(o, "requirement", requirement_to_json(v.requirement));
    json_object_object_add(o, "message", new_string(v.message));
    return o;
}

json_object* violations_to_json(const std::vector<Violation>& vs) {
    json_object* arr = json_object_new_array();
    for (const auto& v : vs) json_object_array_add(arr, violation_to_json(v));
    return arr;
}

json_object* sanitization_error_to_json(const SanitizationError& e) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "kind", json_object_new_string(sanitization_error_kind_name(e.kind)));
    json_object_object_add(o, "detail", new_string(e.detail));
    if (e.position) json_object_object_add(o, "position", json_object_new_int64((int64_t)*e.position));
    if (e.limit) json_object_object_add(o, "limit", json_object_new_int64((int64_t)*e.limit));
    return o;
}

json_object* context_to_json(const ExecutionContext<Authorized>& ctx) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "request_id", new_string(ctx.request_id()));
    json_object_object_add(o, "principal", new_string(ctx.principal().id));
    json_object* caps = json_object_new_array();
    for (CapabilityKind k : ctx.granted()) {
        json_object_array_add(caps, json_object_new_string(capability_kind_name(k)));
    }
    json_object_object_add(o, "capabilities", caps);
    return o;
}

json_object* audit_event_to_json(const AuditEvent& e) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "request_id", new_string(e.request_id));
    json_object_object_add(o, "principal", e.principal ? new_string(*e.principal) : nullptr);
    json_object_object_add(o, "kind", json_object_new_string(audit_event_kind_name(e.kind)));
    json_object_object_add(o, "outcome", json_object_new_string(audit_outcome_name(e.outcome)));
    if (e.action) json_object_object_add(o, "action", new_string(*e.action));
    if (e.resource_id) json_object_object_add(o, "resource_id", new_string(*e.resource_id));
    if (e.method) json_object_object_add(o, "method", new_string(*e.method));
    if (e.redacted_url) json_object_object_add(o, "redacted_url", new_string(*e.redacted_url));
    if (e.body_len) json_object_object_add(o, "body_len", json_object_new_int64((int64_t)*e.body_len));
    return o;
}

// --- Requirement parsing ---

bool requirement_from_str(const std::string& s, PolicyRequirement* out) {
    if (!out) return false;
    static const std::string kActionPrefix = "action:";
    if (s == "authenticated") {
        *out = PolicyRequirement::authenticated();
        return true;
    }
    if (s.compare(0, kActionPrefix.size(), kActionPrefix) == 0) {
        // Malformed action names are still accepted here; the gate reports them.
        *out = PolicyRequirement::authorized_for(s.substr(kActionPrefix.size()));
        return true;
    }
    return false;
}

// --- Document parsing ---

static bool add_params(json_object* root, const char* key, ParamSource source,
                       BoundaryRequest* req, std::string* err) {
    json_object* obj = nullptr;
    if (!json_object_object_get_ex(root, key, &obj) || !obj) return true;
    if (!json_object_is_type(obj, json_type_object)) {
        if (err) *err = std::string("'") + key + "' must be an object";
        return false;
    }
    json_object_object_foreach(obj, name, val) {
        if (!val || !json_object_is_type(val, json_type_string)) {
            if (err) *err = std::string("'") + key + "' values must be strings";
            return false;
        }
        req->add(source, name, std::string(json_object_get_string(val), (size_t)json_object_get_string_len(val)));
    }
    return true;
}

static bool parse_principal(json_object* root, std::optional<Principal>* out, std::string* err) {
    json_object* p = nullptr;
    if (!json_object_object_get_ex(root, "principal", &p) || !p || json_object_is_type(p, json_type_null)) {
        *out = std::nullopt;
        return true;
    }
    if (!json_object_is_type(p, json_type_object)) {
        if (err) *err = "'principal' must be an object or null";
        return false;
    }
    Principal pr;
    if (!json_get_string(p, "id", &pr.id) || pr.id.empty()) {
        if (err) *err = "'principal.id' must be a non-empty string";
        return false;
    }
    json_get_string(p, "name", &pr.name);
    *out = std::move(pr);
    return true;
}

// Every entry must be a known requirement string.
static bool parse_requirements(json_object* root, std::vector<PolicyRequirement>* out, std::string* err) {
    json_object* arr = nullptr;
    if (!json_object_object_get_ex(root, "require", &arr) || !arr) return true;
    if (!json_object_is_type(arr, json_type_array)) {
        if (err) *err = "'require' must be an array of strings";
        return false;
    }
    const int n = (int)json_object_array_length(arr);
    for (int i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(arr, i);
        if (!it || !json_object_is_type(it, json_type_string)) {
            if (err) *err = "'require' must be an array of strings";
            return false;
        }
        std::string s(json_object_get_string(it), (size_t)json_object_get_string_len(it));
        PolicyRequirement r;
        if (!requirement_from_str(s, &r)) {
            if (err) *err = "unknown requirement '" + s + "'";
            return false;
        }
        out->push_back(std::move(r));
    }
    return true;
}

bool request_from_json(const std::string& json, BoundaryRequest* out,
                       std::vector<PolicyRequirement>* requirements, std::string* err) {
    if (!out || !requirements) return false;
    json_object* root = json_tokener_parse(json.c_str());
    if (!root || !json_object_is_type(root, json_type_object)) {
        if (root) json_object_put(root);
        if (err) *err = "request is not a JSON object";
        return false;
    }

    bool ok = true;
    std::string request_id;
    if (!json_get_string(root, "request_id", &request_id) || request_id.empty()) {
        if (err) *err = "'request_id' must be a non-empty string";
        ok = false;
    }

    BoundaryRequest req(request_id);
    std::optional<Principal> principal;
    if (ok) ok = parse_principal(root, &principal, err);
    if (ok) req.set_principal(std::move(principal));
    if (ok) ok = add_params(root, "query", ParamSource::QUERY, &req, err);
    if (ok) ok = add_params(root, "headers", ParamSource::HEADER, &req, err);
    if (ok) ok = add_params(root, "path", ParamSource::PATH, &req, err);

    std::vector<PolicyRequirement> reqs;
    if (ok) ok = parse_requirements(root, &reqs, err);

    json_object_put(root);
    if (!ok) return false;
    *out = std::move(req);
    *requirements = std::move(reqs);
    return true;
}

bool grants_from_json(const std::string& json, StaticAuthorizationProvider* out, std::string* err) {
    if (!out) return false;
    json_object* root = json_tokener_parse(json.c_str());
    json_object* grants = nullptr;
    if (!root || !json_object_is_type(root, json_type_object) ||
        !json_object_object_get_ex(root, "grants", &grants) || !json_object_is_type(grants, json_type_object)) {
        if (root) json_object_put(root);
        if (err) *err = "grants document must be {\"grants\":{...}}";
        return false;
    }

    StaticAuthorizationProvider provider;
    provider.set_allow_wildcard(out->allow_wildcard());
    bool ok = true;
    json_object_object_foreach(grants, principal_id, actions) {
        if (!actions || !json_object_is_type(actions, json_type_array)) {
            if (err) *err = std::string("grants for '") + principal_id + "' must be an array";
            ok = false;
            break;
        }
        const int n = (int)json_object_array_length(actions);
        for (int i = 0; i < n; i++) {
            json_object* a = json_object_array_get_idx(actions, i);
            if (!a || !json_object_is_type(a, json_type_string)) {
                if (err) *err = std::string("grants for '") + principal_id + "' must be strings";
                ok = false;
                break;
            }
            provider.grant(principal_id, json_object_get_string(a));
        }
        if (!ok) break;
    }

    json_object_put(root);
    if (!ok) return false;
    *out = std::move(provider);
    return true;
}

} // namespace warden
