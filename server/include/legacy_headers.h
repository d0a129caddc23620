#pragma once

#include "httplib.h"

namespace cachebust {

// Headers with no enforcement value left in current browsers.
extern const char* const kLegacyHeaders[3];

/*
Removes X-DNS-Prefetch-Control, X-Permitted-Cross-Domain-Policies and
X-XSS-Protection from HTML responses. Must run after the security header
stage and before the response is written.
*/
class LegacyHeaderStripper {
public:
    // Any one signal is enough: the client asks for HTML, the response is
    // HTML, or the path has the shape of an HTML page.
    static bool is_html_response(const httplib::Request& req, const httplib::Response& res);

    // Returns the number of header values removed.
    static size_t strip(const httplib::Request& req, httplib::Response& res);
};

} // namespace cachebust
