#include "session_auth.h"

namespace cachebust {

/*
httplib has no structured cookie API, so the header is parsed by hand.
A match must start at the beginning of the header or right after a "; "
separator, so "xsession=" never satisfies a lookup for "session".
*/
bool get_cookie_value(const httplib::Request& req,
                      const std::string& name,
                      std::string& out) {
    auto it = req.headers.find("Cookie");
    if (it == req.headers.end()) return false;

    const std::string& hdr = it->second;
    const std::string k = name + "=";

    size_t pos = 0;
    while ((pos = hdr.find(k, pos)) != std::string::npos) {
        bool at_boundary = (pos == 0);
        if (!at_boundary) {
            size_t b = pos;
            while (b > 0 && hdr[b - 1] == ' ') --b;
            at_boundary = (b == 0 || hdr[b - 1] == ';');
        }
        if (at_boundary) break;
        pos += k.size();
    }
    if (pos == std::string::npos) return false;
    pos += k.size();

    auto end = hdr.find(';', pos);
    out = hdr.substr(pos,
                     (end == std::string::npos)
                         ? std::string::npos
                         : (end - pos));
    return true;
}

AuthPredicate session_cookie_predicate(const httplib::Request& req, const std::string& cookie_name) {
    if (cookie_name.empty()) return AuthPredicate();
    return [&req, cookie_name]() {
        std::string v;
        return get_cookie_value(req, cookie_name, v) && !v.empty();
    };
}

} // namespace cachebust
