#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "httplib.h"
#include "route_class.h"

namespace cachebust {

extern const char* const kImmutableAssetDirective;
extern const char* const kPageOverrideDirective;

/*
BeforeSendHooks
===============

Actions bound to "the response is about to be written". The response pipeline
owns one list per response and runs it after every other header stage, so the
last registered action has the final word on any header it touches.
*/
class BeforeSendHooks {
public:
    using Action = std::function<void(httplib::Response&)>;

    void add(Action a);

    // Runs every action once, in registration order. Later calls are no-ops.
    void run(httplib::Response& res);

    size_t size() const { return actions_.size(); }
    bool ran() const { return ran_; }

private:
    std::vector<Action> actions_;
    bool ran_ = false;
};

/*
FinalOverrideLayer
==================

Registers (does not execute) the authoritative cache headers for a response:

  static asset -> public, max-age=31536000, immutable, stale-while-revalidate=2592000
  HTML page    -> public, max-age=86400, stale-while-revalidate=3600

plus Vary: Accept-Encoding. API, health and other paths get nothing.
Only GET/HEAD are considered.

When the action runs it replaces Cache-Control and Vary whatever their current
value, and drops Pragma/Expires so no contradicting directive survives.
Redirects and error responses (status >= 300 except 304) are not
content-addressed and are left alone. A 304 refreshes the headers a cache
stored with the 200, so it carries the override as well.
*/
class FinalOverrideLayer {
public:
    static std::optional<std::string> directive_for(RouteClass rc);

    // True if an action was registered.
    static bool attach(const std::string& method, const std::string& path, BeforeSendHooks& hooks);
    static bool attach(const std::string& method, RouteClass rc, BeforeSendHooks& hooks);
};

} // namespace cachebust
