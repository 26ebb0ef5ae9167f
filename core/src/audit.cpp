#include "warden/audit.h"
#include "warden/serialization.h"

#include <sstream>

namespace warden {

const char* audit_event_kind_name(AuditEventKind k) {
    switch (k) {
        case AuditEventKind::AUTHENTICATION:  return "authentication";
        case AuditEventKind::AUTHORIZATION:   return "authorization";
        case AuditEventKind::RESOURCE_ACCESS: return "resource_access";
        case AuditEventKind::STATE_CHANGE:    return "state_change";
        case AuditEventKind::ADMIN_ACTION:    return "admin_action";
        case AuditEventKind::SECURITY_EVENT:  return "security_event";
    }
    return "unknown";
}

const char* audit_outcome_name(AuditOutcome o) {
    switch (o) {
        case AuditOutcome::SUCCESS: return "success";
        case AuditOutcome::DENIED:  return "denied";
        case AuditOutcome::ERROR:   return "error";
    }
    return "unknown";
}

AuditEvent::AuditEvent(std::string request_id_, std::optional<std::string> principal_,
                       AuditEventKind kind_, AuditOutcome outcome_)
    : request_id(std::move(request_id_)),
      principal(std::move(principal_)),
      kind(kind_),
      outcome(outcome_) {}

std::string AuditEvent::to_string() const {
    std::ostringstream os;
    os << "AuditEvent[kind=" << audit_event_kind_name(kind)
       << ", outcome=" << audit_outcome_name(outcome)
       << ", request_id=" << request_id
       << ", principal=" << (principal ? *principal : "<none>");
    if (action) os << ", action=" << *action;
    if (resource_id) os << ", resource_id=" << *resource_id;
    if (method) os << ", method=" << *method;
    if (redacted_url) os << ", url=" << *redacted_url;
    if (body_len) os << ", body_len=" << *body_len;
    os << "]";
    return os.str();
}

// --- AuditTrail ---

void AuditTrail::record(const AuditToken&, AuditEvent event) {
    std::string line = json_to_string(audit_event_to_json(event));
    // Held across the mirror write so log lines follow events_ order.
    std::lock_guard<std::mutex> lk(mu_);
    if (logger_ && !logger_->event("audit", line)) mirror_failures_++;
    events_.push_back(std::move(event));
}

std::vector<AuditEvent> AuditTrail::events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
}

uint64_t AuditTrail::mirror_failures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return mirror_failures_;
}

size_t AuditTrail::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_.size();
}

void AuditTrail::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    events_.clear();
}

} // namespace warden
