#pragma once

#include "log.h"
#include "sink.h"

#include <string>

namespace warden {

// Writes verified messages to the event log as "policy_log" records.
// Requires a LOG token.
class LogSink : public Sink<std::string, CapabilityKind::LOG> {
public:
    LogSink(JsonlLogger& logger, std::string request_id)
        : logger_(logger), request_id_(std::move(request_id)) {}

protected:
    std::optional<SinkError> write(const VerifiedValue<std::string>& value) override;

private:
    JsonlLogger& logger_;
    std::string request_id_;
};

} // namespace warden
