#pragma once

#include "audit.h"
#include "authz.h"
#include "context.h"
#include "policy.h"
#include "request.h"
#include "sanitizer.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace warden {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);
std::string json_to_string(json_object* o);  // plain; consumes `o`

bool json_get_string(json_object* o, const char* k, std::string* out);

// --- Outcome serialization ---

json_object* requirement_to_json(const PolicyRequirement& r);
json_object* violation_to_json(const Violation& v);
json_object* violations_to_json(const std::vector<Violation>& vs);
json_object* sanitization_error_to_json(const SanitizationError& e);
json_object* context_to_json(const ExecutionContext<Authorized>& ctx);
json_object* audit_event_to_json(const AuditEvent& e);

// --- Requirement parsing ---
// "authenticated" or "action:<name>".
bool requirement_from_str(const std::string& s, PolicyRequirement* out);

// --- Document parsing ---
//
// Request document:
//   {"request_id":"r1",
//    "principal":{"id":"u1","name":"Alice"},     (optional)
//    "query":{"k":"v"}, "headers":{...}, "path":{...},
//    "require":["authenticated","action:log"]}
//
// Grants document:
//   {"grants":{"u1":["log","http"],"*":["log"]}}

bool request_from_json(const std::string& json, BoundaryRequest* out,
                       std::vector<PolicyRequirement>* requirements, std::string* err);

bool grants_from_json(const std::string& json, StaticAuthorizationProvider* out, std::string* err);

} // namespace warden
