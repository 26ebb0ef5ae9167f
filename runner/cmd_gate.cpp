#include "commands.h"
#include "runner_utils.h"

#include "warden/audit.h"
#include "warden/gate.h"
#include "warden/log.h"
#include "warden/log_sink.h"
#include "warden/sanitizer.h"
#include "warden/serialization.h"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace warden;

void log_gate_outcome(JsonlLogger& log, const std::string& request_id, json_object* detail, bool allowed) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "request_id", json_object_new_string(request_id.c_str()));
    json_object_object_add(p, "allowed", json_object_new_boolean(allowed ? 1 : 0));
    json_object_object_add(p, "detail", json_object_get(detail));
    if (!log.event("gate", json_to_string(p))) {
        std::cerr << "warning: could not write to " << log.path() << "\n";
    }
}

// Sanitizes every query parameter and writes the accepted ones to `sink`.
// Returns the per-parameter verdicts; `rejected` counts failures.
json_object* drain_query(BoundaryRequest& req, const AuthorizedContext& ctx, const StringSanitizer& sanitizer,
                         LogSink& sink, int* rejected) {
    json_object* params = json_object_new_object();
    for (const auto& name : req.names(ParamSource::QUERY)) {
        auto raw = req.take(ParamSource::QUERY, name);
        if (!raw) continue;

        json_object* verdict = json_object_new_object();
        auto result = sanitizer.sanitize(std::move(*raw));
        if (auto* err = std::get_if<SanitizationError>(&result)) {
            json_object_object_add(verdict, "accepted", json_object_new_boolean(0));
            json_object_object_add(verdict, "error", sanitization_error_to_json(*err));
            (*rejected)++;
        } else {
            const auto& verified = std::get<VerifiedValue<std::string>>(result);
            json_object_object_add(verdict, "accepted", json_object_new_boolean(1));
            auto cap = ctx.log();
            if (!cap) {
                json_object_object_add(verdict, "logged", json_object_new_boolean(0));
            } else if (auto serr = sink.consume(*cap, verified)) {
                json_object_object_add(verdict, "logged", json_object_new_boolean(0));
                json_object_object_add(verdict, "sink_error", json_object_new_string(serr->to_string().c_str()));
            } else {
                json_object_object_add(verdict, "logged", json_object_new_boolean(1));
            }
        }
        json_object_object_add(params, name.c_str(), verdict);
    }
    return params;
}

} // namespace

int cmd_gate(int argc, char** argv) {
    using namespace warden;
    if (argc < 4) {
        std::cerr << "usage: warden_cli gate <request.json> <grants.json>\n";
        return 2;
    }

    RuntimeConfig cfg;
    if (!load_cli_config(&cfg)) return 2;

    std::string request_json, grants_json;
    if (!slurp_file(argv[2], &request_json)) {
        std::cerr << "cannot read request file: " << argv[2] << "\n";
        return 3;
    }
    if (!slurp_file(argv[3], &grants_json)) {
        std::cerr << "cannot read grants file: " << argv[3] << "\n";
        return 3;
    }

    std::string err;
    BoundaryRequest req;
    std::vector<PolicyRequirement> requirements;
    if (!request_from_json(request_json, &req, &requirements, &err)) {
        std::cerr << "bad request: " << err << "\n";
        return 3;
    }
    StaticAuthorizationProvider authz;
    authz.set_allow_wildcard(cfg.allow_wildcard);
    if (!grants_from_json(grants_json, &authz, &err)) {
        std::cerr << "bad grants: " << err << "\n";
        return 3;
    }

    JsonlLogger log(cfg.audit_log_path, profile_name(cfg.profile));
    if (!log.ok()) std::cerr << "warning: event log unavailable: " << cfg.audit_log_path << "\n";

    PolicyGate gate(req.metadata(), authz);
    for (auto& r : requirements) gate.require(std::move(r));
    GateResult result = std::move(gate).build();

    json_object* out = json_object_new_object();
    json_object_object_add(out, "request_id", json_object_new_string(req.request_id().c_str()));

    if (auto* violations = std::get_if<std::vector<Violation>>(&result)) {
        json_object* vj = violations_to_json(*violations);
        log_gate_outcome(log, req.request_id(), vj, false);
        json_object_object_add(out, "ok", json_object_new_boolean(0));
        json_object_object_add(out, "violations", vj);
        print_json(out);
        return 1;
    }

    const AuthorizedContext& ctx = std::get<AuthorizedContext>(result);
    json_object* cj = context_to_json(ctx);
    log_gate_outcome(log, req.request_id(), cj, true);

    AuditTrail trail(&log);
    if (auto cap = ctx.audit()) {
        trail.record(*cap, AuditEvent(ctx.request_id(), ctx.principal().id,
                                      AuditEventKind::AUTHORIZATION, AuditOutcome::SUCCESS));
    }

    StringSanitizer sanitizer(cfg.max_input_len);
    LogSink sink(log, ctx.request_id());
    int rejected = 0;
    json_object* params = drain_query(req, ctx, sanitizer, sink, &rejected);

    if (auto cap = ctx.audit()) {
        trail.record(*cap, AuditEvent(ctx.request_id(), ctx.principal().id, AuditEventKind::RESOURCE_ACCESS,
                                      rejected > 0 ? AuditOutcome::DENIED : AuditOutcome::SUCCESS)
                               .with_action("sanitize_query"));
    }

    json_object_object_add(out, "ok", json_object_new_boolean(rejected == 0 ? 1 : 0));
    json_object_object_add(out, "context", cj);
    json_object_object_add(out, "params", params);
    json_object_object_add(out, "audit_events", json_object_new_int64((int64_t)trail.size()));
    print_json(out);
    return rejected == 0 ? 0 : 1;
}
