#include "warden/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace warden {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize JSON with sorted keys.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        int len = (int)json_object_array_length(obj);
        for (int i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_object* obj = json_tokener_parse(raw.c_str());
    if (!obj) return raw;
    std::ostringstream out;
    canonical_serialize(obj, out);
    json_object_put(obj);
    return out.str();
}

JsonlLogger::JsonlLogger(const std::string& path, std::string profile, bool truncate)
    : path_(path),
      profile_(std::move(profile)),
      out_(path, truncate ? (std::ios::out | std::ios::trunc) : (std::ios::out | std::ios::app)) {}

bool JsonlLogger::ok() const {
    std::lock_guard<std::mutex> lk(mu_);
    return out_.is_open() && out_.good();
}

bool JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open() || !out_.good()) return false;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));

    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload",
        pobj ? pobj : json_object_new_string_len(payload_json.c_str(), (int)payload_json.size()));

    json_object_object_add(rec, "profile", json_object_new_string(profile_.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)seq_));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    out_ << line.str() << "\n";
    out_.flush();
    if (!out_.good()) return false;
    seq_++;
    return true;
}

uint64_t JsonlLogger::events_written() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

} // namespace warden
