#include "runner_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace warden {

bool slurp_file(const std::string& path, std::string* out, size_t max_bytes) {
    if (!out) return false;
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string data = ss.str();
    if (data.size() > max_bytes) return false;
    *out = std::move(data);
    return true;
}

bool load_cli_config(RuntimeConfig* cfg) {
    apply_profile_defaults(detect_profile());
    std::string err = load_runtime_config(cfg);
    if (!err.empty()) {
        std::cerr << "config error: " << err << "\n";
        return false;
    }
    return true;
}

void print_json(json_object* o) {
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN) << "\n";
    json_object_put(o);
}

} // namespace warden
