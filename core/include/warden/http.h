#pragma once

// HttpRecorder: reference egress sink gated by an HTTP capability.
//
// Records what would have been sent (method, URL, body length) instead of
// touching the network. Request bodies are never stored.

#include "capability.h"
#include "sink.h"
#include "verified.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

enum class HttpMethod : uint8_t { GET, POST, PUT, DEL, PATCH };

const char* http_method_name(HttpMethod m);

struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string url;
    size_t body_len{0};

    bool operator==(const HttpRequest&) const = default;
};

class HttpRecorder : public Sink<std::string, CapabilityKind::HTTP> {
public:
    std::optional<SinkError> get(const HttpToken& cap, const VerifiedValue<std::string>& url);
    std::optional<SinkError> post(const HttpToken& cap, const VerifiedValue<std::string>& url,
                                  const VerifiedValue<std::string>& body);
    std::optional<SinkError> put(const HttpToken& cap, const VerifiedValue<std::string>& url,
                                 const VerifiedValue<std::string>& body);
    std::optional<SinkError> del(const HttpToken& cap, const VerifiedValue<std::string>& url);
    std::optional<SinkError> patch(const HttpToken& cap, const VerifiedValue<std::string>& url,
                                   const VerifiedValue<std::string>& body);

    std::vector<HttpRequest> requests() const;
    size_t request_count() const;

protected:
    // consume(): a GET of the verified URL.
    std::optional<SinkError> write(const VerifiedValue<std::string>& url) override;

private:
    std::optional<SinkError> record(HttpMethod method, const std::string& url, size_t body_len);

    mutable std::mutex mu_;
    std::vector<HttpRequest> requests_;
};

} // namespace warden
