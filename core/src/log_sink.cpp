#include "warden/log_sink.h"

#include <json-c/json.h>

namespace warden {

std::optional<SinkError> LogSink::write(const VerifiedValue<std::string>& value) {
    if (!logger_.ok()) {
        return SinkError{SinkErrorKind::UNAVAILABLE, "event log is not open"};
    }

    json_object* payload = json_object_new_object();
    json_object_object_add(payload, "request_id", json_object_new_string(request_id_.c_str()));
    json_object_object_add(payload, "message",
        json_object_new_string_len(value->c_str(), (int)value->size()));
    std::string payload_json = json_object_to_json_string_ext(payload, JSON_C_TO_STRING_PLAIN);
    json_object_put(payload);

    if (!logger_.event("policy_log", payload_json)) {
        return SinkError{SinkErrorKind::TRANSPORT, "event log write failed"};
    }
    return std::nullopt;
}

} // namespace warden
