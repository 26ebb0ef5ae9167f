#pragma once

#include "warden/config.h"

#include <json-c/json.h>

#include <string>

namespace warden {

// Reads a whole file. Returns false if it cannot be opened or exceeds max_bytes.
bool slurp_file(const std::string& path, std::string* out, size_t max_bytes = 1024 * 1024);

// Applies profile defaults and loads the runtime config. Prints the error
// to stderr and returns false on a bad environment.
bool load_cli_config(RuntimeConfig* cfg);

// Writes `o` to stdout as one JSON line and releases it.
void print_json(json_object* o);

} // namespace warden
