#include "warden/secret.h"

namespace warden {

std::string redact_url(const std::string& url) {
    std::string out = url;

    // Query and fragment can both carry tokens; drop everything after the
    // first of them.
    size_t cut = out.find_first_of("?#");
    if (cut != std::string::npos) {
        out.erase(cut);
        out += "?";
        out += kRedacted;
    }

    // userinfo sits between "scheme://" and the first '@' of the authority
    size_t scheme = out.find("://");
    size_t auth_begin = (scheme == std::string::npos) ? 0 : scheme + 3;
    size_t auth_end = out.find('/', auth_begin);
    if (auth_end == std::string::npos) auth_end = out.find('?', auth_begin);
    if (auth_end == std::string::npos) auth_end = out.size();
    size_t at = out.rfind('@', auth_end == 0 ? 0 : auth_end - 1);
    if (at != std::string::npos && at >= auth_begin && at < auth_end) {
        out.erase(auth_begin, at + 1 - auth_begin);
    }
    return out;
}

} // namespace warden
