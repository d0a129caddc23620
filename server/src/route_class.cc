#include "route_class.h"
#include "cachebust_util.h"

namespace cachebust {

static const char* const kStaticExts[] = {
    ".css", ".js", ".map",
    ".png", ".jpg", ".jpeg", ".gif", ".ico", ".svg", ".webp", ".avif",
    ".woff", ".woff2", ".ttf", ".eot",
};

static bool is_under(const std::string& path, const std::string& prefix) {
    if (path == prefix) return true;
    return starts_with(path, prefix + "/");
}

// Query strings never reach here from httplib (req.path), but callers passing
// raw targets get the same answer.
static std::string path_only(const std::string& path) {
    const auto q = path.find_first_of("?#");
    return q == std::string::npos ? path : path.substr(0, q);
}

bool has_static_asset_ext(const std::string& path) {
    const std::string p = path_only(path);
    for (const char* ext : kStaticExts) {
        if (ends_with_ci(p, ext)) return true;
    }
    return false;
}

RouteClass classify_route(const std::string& raw_path) {
    const std::string path = path_only(raw_path);

    if (is_under(path, "/api")) return RouteClass::API;
    if (is_under(path, "/health")) return RouteClass::HEALTH;
    if (has_static_asset_ext(path)) return RouteClass::STATIC_ASSET;
    if (path.find('.') == std::string::npos) return RouteClass::HTML_PAGE;
    return RouteClass::OTHER;
}

const char* route_class_name(RouteClass c) {
    switch (c) {
        case RouteClass::API:          return "api";
        case RouteClass::HEALTH:       return "health";
        case RouteClass::STATIC_ASSET: return "static_asset";
        case RouteClass::HTML_PAGE:    return "html_page";
        case RouteClass::OTHER:        return "other";
    }
    return "other";
}

bool is_safe_read_method(const std::string& method) {
    return method == "GET" || method == "HEAD";
}

} // namespace cachebust
