#include "commands.h"
#include "runner_utils.h"

#include "warden/sanitizer.h"
#include "warden/serialization.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

int cmd_sanitize(int argc, char** argv) {
    using namespace warden;
    if (argc < 3) {
        std::cerr << "usage: warden_cli sanitize <text> [max_len]\n";
        return 2;
    }

    RuntimeConfig cfg;
    if (!load_cli_config(&cfg)) return 2;

    StringSanitizerConfig scfg{cfg.max_input_len};
    if (argc >= 4) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(argv[3], &end, 10);
        if (!end || *end != '\0' || argv[3][0] == '-') {
            std::cerr << "max_len must be a non-negative integer\n";
            return 2;
        }
        scfg.max_len = static_cast<size_t>(n);
    }

    auto result = sanitize(Untrusted<std::string>(argv[2]), scfg);

    json_object* out = json_object_new_object();
    if (auto* v = std::get_if<VerifiedValue<std::string>>(&result)) {
        json_object_object_add(out, "ok", json_object_new_boolean(1));
        json_object_object_add(out, "value", json_object_new_string_len(v->get().c_str(), (int)v->get().size()));
        print_json(out);
        return 0;
    }
    json_object_object_add(out, "ok", json_object_new_boolean(0));
    json_object_object_add(out, "error", sanitization_error_to_json(std::get<SanitizationError>(result)));
    print_json(out);
    return 1;
}
