#include "legacy_headers.h"
#include "cachebust_util.h"
#include "route_class.h"

#include <string>

namespace cachebust {

const char* const kLegacyHeaders[3] = {
    "X-DNS-Prefetch-Control",
    "X-Permitted-Cross-Domain-Policies",
    "X-XSS-Protection",
};

static bool accepts_html(const httplib::Request& req) {
    const std::string accept = lower_ascii(req.get_header_value("Accept"));
    return accept.find("text/html") != std::string::npos ||
           accept.find("application/xhtml+xml") != std::string::npos;
}

bool LegacyHeaderStripper::is_html_response(const httplib::Request& req, const httplib::Response& res) {
    if (accepts_html(req)) return true;

    const std::string ct = lower_ascii(res.get_header_value("Content-Type"));
    if (ct.find("text/html") != std::string::npos) return true;

    return classify_route(req.path) == RouteClass::HTML_PAGE;
}

size_t LegacyHeaderStripper::strip(const httplib::Request& req, httplib::Response& res) {
    if (!is_html_response(req, res)) return 0;

    size_t removed = 0;
    for (const char* h : kLegacyHeaders) {
        removed += res.headers.erase(h);
    }
    return removed;
}

} // namespace cachebust
