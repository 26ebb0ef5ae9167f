#pragma once

// Audit events and the in-memory audit trail.
//
// Recording requires an AUDIT capability. Events are built by trusted code
// (the caller decides what happened), so they are not routed through a
// sanitizer; URLs must be passed through redact_url() before they are
// attached.

#include "capability.h"
#include "log.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

enum class AuditEventKind : uint8_t {
    AUTHENTICATION,
    AUTHORIZATION,
    RESOURCE_ACCESS,
    STATE_CHANGE,
    ADMIN_ACTION,
    SECURITY_EVENT,
};

enum class AuditOutcome : uint8_t { SUCCESS, DENIED, ERROR };

const char* audit_event_kind_name(AuditEventKind k);
const char* audit_outcome_name(AuditOutcome o);

struct AuditEvent {
    std::string request_id;
    std::optional<std::string> principal;  // principal id only
    AuditEventKind kind{AuditEventKind::SECURITY_EVENT};
    AuditOutcome outcome{AuditOutcome::SUCCESS};
    std::optional<std::string> action;
    std::optional<std::string> resource_id;
    std::optional<std::string> method;
    std::optional<std::string> redacted_url;
    std::optional<size_t> body_len;

    AuditEvent() = default;
    AuditEvent(std::string request_id, std::optional<std::string> principal,
               AuditEventKind kind, AuditOutcome outcome);

    AuditEvent& with_action(std::string a) { action = std::move(a); return *this; }
    AuditEvent& with_resource_id(std::string r) { resource_id = std::move(r); return *this; }
    AuditEvent& with_method(std::string m) { method = std::move(m); return *this; }
    AuditEvent& with_redacted_url(std::string u) { redacted_url = std::move(u); return *this; }
    AuditEvent& with_body_len(size_t n) { body_len = n; return *this; }

    // AuditEvent[kind=..., outcome=..., request_id=..., principal=..., ...]
    std::string to_string() const;
};

// Ordered, thread-safe record of audit events. If a logger is attached,
// each recorded event is also written as an "audit" line, in the same order
// as events().
class AuditTrail {
public:
    AuditTrail() = default;
    explicit AuditTrail(JsonlLogger* logger) : logger_(logger) {}

    void record(const AuditToken& cap, AuditEvent event);

    std::vector<AuditEvent> events() const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

    // Events that could not be written to the attached logger.
    uint64_t mirror_failures() const;

private:
    JsonlLogger* logger_{nullptr};
    uint64_t mirror_failures_{0};
    mutable std::mutex mu_;
    std::vector<AuditEvent> events_;
};

} // namespace warden
