#include "final_override.h"
#include "http_headers.h"

namespace cachebust {

const char* const kImmutableAssetDirective =
    "public, max-age=31536000, immutable, stale-while-revalidate=2592000";
const char* const kPageOverrideDirective =
    "public, max-age=86400, stale-while-revalidate=3600";

void BeforeSendHooks::add(Action a) {
    if (a) actions_.push_back(std::move(a));
}

void BeforeSendHooks::run(httplib::Response& res) {
    if (ran_) return;
    ran_ = true;
    for (auto& a : actions_) a(res);
}

std::optional<std::string> FinalOverrideLayer::directive_for(RouteClass rc) {
    switch (rc) {
        case RouteClass::STATIC_ASSET: return std::string(kImmutableAssetDirective);
        case RouteClass::HTML_PAGE:    return std::string(kPageOverrideDirective);
        case RouteClass::API:
        case RouteClass::HEALTH:
        case RouteClass::OTHER:
            break;
    }
    return std::nullopt;
}

bool FinalOverrideLayer::attach(const std::string& method, const std::string& path, BeforeSendHooks& hooks) {
    return attach(method, classify_route(path), hooks);
}

bool FinalOverrideLayer::attach(const std::string& method, RouteClass rc, BeforeSendHooks& hooks) {
    if (!is_safe_read_method(method)) return false;

    const std::optional<std::string> directive = directive_for(rc);
    if (!directive) return false;

    hooks.add([directive = *directive](httplib::Response& res) {
        // 304 refreshes the stored headers of the cached 200, so it gets them too.
        if (res.status >= 300 && res.status != 304) return;
        replace_header(res, "Cache-Control", directive);
        replace_header(res, "Vary", "Accept-Encoding");
        remove_header(res, "Pragma");
        remove_header(res, "Expires");
    });
    return true;
}

} // namespace cachebust
