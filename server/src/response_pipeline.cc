#include "response_pipeline.h"
#include "http_headers.h"
#include "legacy_headers.h"
#include "route_class.h"

#include <exception>
#include <iostream>

namespace cachebust {

ResponsePipeline::ResponsePipeline(const CachePolicyEngine& policy, AuthProvider auth)
    : policy_(policy), auth_(std::move(auth)) {}

void ResponsePipeline::apply_security_headers(httplib::Response& res) {
    replace_header(res, "X-Content-Type-Options", "nosniff");
    replace_header(res, "X-Frame-Options", "DENY");
    replace_header(res, "Referrer-Policy", "no-referrer");

    replace_header(res, "X-DNS-Prefetch-Control", "off");
    replace_header(res, "X-Permitted-Cross-Domain-Policies", "none");
    replace_header(res, "X-XSS-Protection", "0");
}

AuthPredicate ResponsePipeline::auth_for_(const httplib::Request& req) const {
    if (!auth_) return AuthPredicate();
    try {
        return auth_(req);
    } catch (const std::exception& e) {
        std::cerr << "[pipeline] WARNING: auth provider failed: " << e.what() << std::endl;
    }
    return AuthPredicate();
}

void ResponsePipeline::before_routing(const httplib::Request& /*req*/, httplib::Response& res) const {
    apply_security_headers(res);
}

void ResponsePipeline::after_routing(const httplib::Request& req, httplib::Response& res) const {
    const AuthPredicate auth = auth_for_(req);

    // 1) cache policy
    if (auto d = policy_.decide(req.method, req.path, auth)) {
        CachePolicyEngine::apply(CachePolicyEngine::for_status(*d, res.status), res);
    }

    // 2) legacy header removal
    LegacyHeaderStripper::strip(req, res);

    // 3) final override, registered only where it cannot make a personalized
    //    or development response cacheable
    BeforeSendHooks hooks;
    if (!policy_.is_development()) {
        const RouteClass rc = classify_route(req.path);
        const bool personalized =
            rc == RouteClass::HTML_PAGE && CachePolicyEngine::is_authenticated(auth);
        if (!personalized) {
            FinalOverrideLayer::attach(req.method, rc, hooks);
        }
    }

    // 4) before-send
    hooks.run(res);
}

void ResponsePipeline::install(httplib::Server& srv) const {
    srv.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        before_routing(req, res);
        return httplib::Server::HandlerResponse::Unhandled;
    });
    srv.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        after_routing(req, res);
    });
}

} // namespace cachebust
