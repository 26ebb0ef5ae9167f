#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace warden {

// Append-only JSON Lines event log.
//
// Each line is a canonical (sorted keys, no whitespace) JSON object:
//   {"event":..., "payload":{...}, "profile":..., "seq":N, "ts":"...Z"}
// A payload that is not valid JSON is stored as a JSON string.
// Thread-safe.
class JsonlLogger {
public:
    JsonlLogger(const std::string& path, std::string profile = "dev", bool truncate = false);

    JsonlLogger(const JsonlLogger&) = delete;
    JsonlLogger& operator=(const JsonlLogger&) = delete;

    bool ok() const;

    // Returns false if the line could not be written.
    bool event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    uint64_t events_written() const;

private:
    std::string path_;
    std::string profile_;
    mutable std::mutex mu_;
    std::ofstream out_;
    uint64_t seq_{0};
};

// Sorted-key, whitespace-free re-serialization. Returns the input unchanged
// if it is not valid JSON.
std::string canonicalize_json(const std::string& raw);

} // namespace warden
