#pragma once

#include <functional>
#include <string>

#include "httplib.h"
#include "cache_policy.h"
#include "final_override.h"

namespace cachebust {

// Builds the auth predicate for one request. Empty => anonymous.
using AuthProvider = std::function<AuthPredicate(const httplib::Request&)>;

/*
ResponsePipeline
================

Header stages around every response served by an httplib::Server.

  before routing:
    security headers (nosniff, frame deny, referrer policy and the legacy
    trio still emitted for old clients)

  after routing, right before the status line and headers are written:
    1. CachePolicyEngine decision, adjusted for the response status
    2. LegacyHeaderStripper (HTML responses only)
    3. FinalOverrideLayer registration
         - not in development
         - not for HTML pages of authenticated requests
    4. BeforeSend hooks (the override runs here, last)

The pipeline holds a reference to the engine; both must outlive the server.
*/
class ResponsePipeline {
public:
    ResponsePipeline(const CachePolicyEngine& policy, AuthProvider auth);

    static void apply_security_headers(httplib::Response& res);

    void before_routing(const httplib::Request& req, httplib::Response& res) const;
    void after_routing(const httplib::Request& req, httplib::Response& res) const;

    // Registers both stages on the server.
    void install(httplib::Server& srv) const;

private:
    const CachePolicyEngine& policy_;
    AuthProvider auth_;

    AuthPredicate auth_for_(const httplib::Request& req) const;
};

} // namespace cachebust
