#include "warden/http.h"

namespace warden {

const char* http_method_name(HttpMethod m) {
    switch (m) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::DEL:    return "DELETE";
        case HttpMethod::PATCH:  return "PATCH";
    }
    return "GET";
}

std::optional<SinkError> HttpRecorder::record(HttpMethod method, const std::string& url, size_t body_len) {
    std::lock_guard<std::mutex> lk(mu_);
    requests_.push_back(HttpRequest{method, url, body_len});
    return std::nullopt;
}

std::optional<SinkError> HttpRecorder::write(const VerifiedValue<std::string>& url) {
    return record(HttpMethod::GET, url.get(), 0);
}

std::optional<SinkError> HttpRecorder::get(const HttpToken&, const VerifiedValue<std::string>& url) {
    return record(HttpMethod::GET, url.get(), 0);
}

std::optional<SinkError> HttpRecorder::post(const HttpToken&, const VerifiedValue<std::string>& url,
                                            const VerifiedValue<std::string>& body) {
    return record(HttpMethod::POST, url.get(), body->size());
}

std::optional<SinkError> HttpRecorder::put(const HttpToken&, const VerifiedValue<std::string>& url,
                                           const VerifiedValue<std::string>& body) {
    return record(HttpMethod::PUT, url.get(), body->size());
}

std::optional<SinkError> HttpRecorder::del(const HttpToken&, const VerifiedValue<std::string>& url) {
    return record(HttpMethod::DEL, url.get(), 0);
}

std::optional<SinkError> HttpRecorder::patch(const HttpToken&, const VerifiedValue<std::string>& url,
                                             const VerifiedValue<std::string>& body) {
    return record(HttpMethod::PATCH, url.get(), body->size());
}

std::vector<HttpRequest> HttpRecorder::requests() const {
    std::lock_guard<std::mutex> lk(mu_);
    return requests_;
}

size_t HttpRecorder::request_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return requests_.size();
}

} // namespace warden
