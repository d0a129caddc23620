#pragma once

#include <functional>
#include <optional>
#include <string>

#include "httplib.h"

namespace cachebust {

enum class CacheKind {
    NO_STORE,             // development: nothing is cached
    LONG_LIVED,           // fingerprinted static assets
    PUBLIC_REVALIDATABLE, // public HTML pages
    REVALIDATE,           // static path answered with a redirect or an error
};

struct CacheDecision {
    CacheKind kind = CacheKind::PUBLIC_REVALIDATABLE;
    std::string directive;        // Cache-Control value
    std::string vary;             // Vary value
    long ttl_seconds = 0;         // max-age carried by the directive (0 for NO_STORE)
    bool legacy_no_cache = false; // also emit Pragma: no-cache / Expires: 0
};

// Zero-argument "is this request authenticated?" supplied by the auth layer.
// Empty or throwing => not authenticated.
using AuthPredicate = std::function<bool()>;

// Defaults used whenever a setting is unset, non-positive or its lookup fails.
struct CacheTtlDefaults {
    long max_age = 3600;
    long static_max_age = 604800;
    long static_stale_while_revalidate = 86400;
    long page_stale_while_revalidate = 60;
};

struct CachePolicyConfig {
    // "development" / "production" / anything else. Empty callback or a throw
    // => "production".
    std::function<std::string()> environment;

    // Integer settings by key:
    //   max_age
    //   static_assets.max_age, static_assets.stale_while_revalidate
    //   pages.max_age, pages.stale_while_revalidate
    // nullopt => unset. May throw; a throw is treated as unset.
    std::function<std::optional<long>(const std::string& key)> lookup_seconds;

    CacheTtlDefaults defaults;
};

/*
CachePolicyEngine
=================

Per-request decision, first match wins:

  1. method is not GET/HEAD            -> no policy
  2. API route                         -> no policy
  3. environment == development        -> no-cache, no-store, must-revalidate
                                          (+ Pragma: no-cache, Expires: 0)
  4. authenticated                     -> no policy (never cache personalized
                                          content)
  5. static asset                      -> public, max-age, stale-while-revalidate
                                          (static_assets.*)
  6. anything else (public page)       -> public, max-age, stale-while-revalidate
                                          (pages.*)

Every directive comes with Vary: Accept-Encoding.

The long-lived directive only fits content-addressed bodies. Once the status
is known, for_status() turns it into "no-cache" for anything other than 2xx
and 304: a redirect from a logical path or a 404 for a not yet deployed
fingerprint must be revalidated, not kept for days.

Collaborator failures (auth predicate, configuration) never abort the request;
they resolve to "unauthenticated" and to the default TTLs.
*/
class CachePolicyEngine {
public:
    explicit CachePolicyEngine(CachePolicyConfig cfg);

    // nullopt => no policy: leave the response headers as they are.
    std::optional<CacheDecision> decide(const std::string& method,
                                        const std::string& path,
                                        const AuthPredicate& auth) const;

    std::string environment() const;
    bool is_development() const;

    static CacheDecision for_status(CacheDecision d, int status);

    // Sets Cache-Control, Vary and (for NO_STORE) Pragma/Expires, replacing
    // whatever an earlier layer put there.
    static void apply(const CacheDecision& d, httplib::Response& res);

    static bool is_authenticated(const AuthPredicate& auth);

private:
    CachePolicyConfig cfg_;

    long setting_seconds_(const std::string& key, long fallback) const;
};

} // namespace cachebust
