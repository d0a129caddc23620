#include "cache_policy.h"
#include "cachebust_util.h"
#include "http_headers.h"
#include "route_class.h"

#include <exception>
#include <iostream>

namespace cachebust {

static const char* kVaryAcceptEncoding = "Accept-Encoding";
static const char* kNoStoreDirective = "no-cache, no-store, must-revalidate";
static const char* kRevalidateDirective = "no-cache";

CachePolicyEngine::CachePolicyEngine(CachePolicyConfig cfg) : cfg_(std::move(cfg)) {}

std::string CachePolicyEngine::environment() const {
    if (!cfg_.environment) return "production";
    try {
        const std::string env = lower_ascii(cfg_.environment());
        return env.empty() ? "production" : env;
    } catch (const std::exception& e) {
        std::cerr << "[cache] WARNING: environment lookup failed, assuming production: "
                  << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[cache] WARNING: environment lookup failed, assuming production" << std::endl;
    }
    return "production";
}

bool CachePolicyEngine::is_development() const {
    return environment() == "development";
}

/*
Fail-closed authentication check.

The predicate belongs to the auth layer. If it is missing or throws we cannot
tell who is asking, so the request is treated as anonymous: only the public
variant of a page is ever cached for it.
*/
bool CachePolicyEngine::is_authenticated(const AuthPredicate& auth) {
    if (!auth) return false;
    try {
        return auth();
    } catch (const std::exception& e) {
        std::cerr << "[cache] WARNING: auth predicate threw, treating as unauthenticated: "
                  << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[cache] WARNING: auth predicate threw, treating as unauthenticated" << std::endl;
    }
    return false;
}

long CachePolicyEngine::setting_seconds_(const std::string& key, long fallback) const {
    if (!cfg_.lookup_seconds) return fallback;
    try {
        const std::optional<long> v = cfg_.lookup_seconds(key);
        if (v && *v > 0) return *v;
    } catch (const std::exception& e) {
        std::cerr << "[cache] WARNING: setting " << key << " unavailable, using "
                  << fallback << ": " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[cache] WARNING: setting " << key << " unavailable, using "
                  << fallback << std::endl;
    }
    return fallback;
}

std::optional<CacheDecision> CachePolicyEngine::decide(const std::string& method,
                                                       const std::string& path,
                                                       const AuthPredicate& auth) const {
    if (!is_safe_read_method(method)) return std::nullopt;

    const RouteClass rc = classify_route(path);
    if (rc == RouteClass::API) return std::nullopt;

    if (is_development()) {
        CacheDecision d;
        d.kind = CacheKind::NO_STORE;
        d.directive = kNoStoreDirective;
        d.vary = kVaryAcceptEncoding;
        d.ttl_seconds = 0;
        d.legacy_no_cache = true;
        return d;
    }

    if (is_authenticated(auth)) return std::nullopt;

    const CacheTtlDefaults& def = cfg_.defaults;
    CacheDecision d;
    d.vary = kVaryAcceptEncoding;

    if (rc == RouteClass::STATIC_ASSET) {
        const long max_age = setting_seconds_("static_assets.max_age", def.static_max_age);
        const long swr = setting_seconds_("static_assets.stale_while_revalidate",
                                          def.static_stale_while_revalidate);
        d.kind = CacheKind::LONG_LIVED;
        d.ttl_seconds = max_age;
        d.directive = "public, max-age=" + std::to_string(max_age) +
                      ", stale-while-revalidate=" + std::to_string(swr);
        return d;
    }

    // Pages fall back to the global max_age before the built-in default.
    const long global_max_age = setting_seconds_("max_age", def.max_age);
    const long max_age = setting_seconds_("pages.max_age", global_max_age);
    const long swr = setting_seconds_("pages.stale_while_revalidate", def.page_stale_while_revalidate);
    d.kind = CacheKind::PUBLIC_REVALIDATABLE;
    d.ttl_seconds = max_age;
    d.directive = "public, max-age=" + std::to_string(max_age) +
                  ", stale-while-revalidate=" + std::to_string(swr);
    return d;
}

CacheDecision CachePolicyEngine::for_status(CacheDecision d, int status) {
    if (d.kind != CacheKind::LONG_LIVED) return d;
    if ((status >= 200 && status < 300) || status == 304) return d;

    d.kind = CacheKind::REVALIDATE;
    d.directive = kRevalidateDirective;
    d.ttl_seconds = 0;
    return d;
}

void CachePolicyEngine::apply(const CacheDecision& d, httplib::Response& res) {
    replace_header(res, "Cache-Control", d.directive);
    if (d.legacy_no_cache) {
        replace_header(res, "Pragma", "no-cache");
        replace_header(res, "Expires", "0");
    }
    if (!d.vary.empty()) replace_header(res, "Vary", d.vary);
}

} // namespace cachebust
