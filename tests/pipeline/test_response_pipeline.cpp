// tests/pipeline/test_response_pipeline.cpp
//
// Header stages as the server runs them, driven with in-memory
// httplib::Request/Response pairs:
// - the final override wins over the cache policy on static assets
// - HTML responses lose the legacy headers, other responses keep them
// - no override in development, none for authenticated HTML pages
// - API and health responses are never touched by the override
// - redirects and errors keep the policy's headers
// - session cookie predicate
// - static asset serving: 200 / 304 / 302 to fingerprinted URL / 403 / 404

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include "httplib.h"
#include "asset_manifest.h"
#include "session_auth.h"
#include "cache_policy.h"
#include "final_override.h"
#include "http_headers.h"
#include "legacy_headers.h"
#include "response_pipeline.h"
#include "static_serve.h"

using namespace cachebust;
namespace fs = std::filesystem;

static int failures = 0;

static void expect_eq(const char* name, const std::string& got, const std::string& want) {
    if (got == want) return;
    std::fprintf(stderr, "[%s] FAIL: got '%s' want '%s'\n", name, got.c_str(), want.c_str());
    failures++;
}

static void expect_true(const char* name, bool cond) {
    if (cond) return;
    std::fprintf(stderr, "[%s] FAIL\n", name);
    failures++;
}

static CachePolicyConfig env_config(const std::string& env) {
    CachePolicyConfig c;
    c.environment = [env]() { return env; };
    return c;
}

static httplib::Request make_req(const std::string& method, const std::string& path) {
    httplib::Request req;
    req.method = method;
    req.path = path;
    return req;
}

// before routing -> handler -> after routing, as httplib::Server does it.
static void run(const ResponsePipeline& p, const httplib::Request& req, httplib::Response& res,
                int status, const std::string& content_type) {
    p.before_routing(req, res);
    res.status = status;
    res.set_content("body", content_type);
    p.after_routing(req, res);
}

int main() {
    const std::string cookie = "cachebust_session";
    const AuthProvider by_cookie = [cookie](const httplib::Request& req) {
        return session_cookie_predicate(req, cookie);
    };

    CachePolicyEngine prod(env_config("production"));
    CachePolicyEngine dev(env_config("development"));
    ResponsePipeline pipeline(prod, by_cookie);
    ResponsePipeline dev_pipeline(dev, by_cookie);

    // Static asset: override beats the policy engine's directive
    {
        const auto req = make_req("GET", "/css/app.1f3a9c0e.css");
        httplib::Response res;
        run(pipeline, req, res, 200, "text/css; charset=utf-8");
        expect_eq("static_cc", res.get_header_value("Cache-Control"), kImmutableAssetDirective);
        expect_true("static_cc_single", header_count(res, "Cache-Control") == 1);
        expect_eq("static_vary", res.get_header_value("Vary"), "Accept-Encoding");
        expect_true("static_vary_single", header_count(res, "Vary") == 1);
        expect_eq("static_nosniff", res.get_header_value("X-Content-Type-Options"), "nosniff");
        expect_true("static_keeps_legacy", res.has_header("X-XSS-Protection"));
    }

    // Same for a signed-in user: fingerprinted assets are not personalized
    {
        auto req = make_req("GET", "/js/app.77b0d412.js");
        req.headers.emplace("Cookie", "theme=dark; cachebust_session=abc123");
        httplib::Response res;
        run(pipeline, req, res, 200, "application/javascript");
        expect_eq("static_auth_cc", res.get_header_value("Cache-Control"), kImmutableAssetDirective);
    }

    // Anonymous HTML page
    {
        auto req = make_req("GET", "/");
        req.headers.emplace("Accept", "text/html,application/xhtml+xml");
        httplib::Response res;
        run(pipeline, req, res, 200, "text/html; charset=utf-8");
        expect_eq("page_cc", res.get_header_value("Cache-Control"), kPageOverrideDirective);
        expect_true("page_cc_single", header_count(res, "Cache-Control") == 1);
        expect_true("page_no_xss", !res.has_header("X-XSS-Protection"));
        expect_true("page_no_dns", !res.has_header("X-DNS-Prefetch-Control"));
        expect_true("page_no_xdomain", !res.has_header("X-Permitted-Cross-Domain-Policies"));
        expect_eq("page_frame", res.get_header_value("X-Frame-Options"), "DENY");
    }

    // Authenticated HTML page: nothing makes it cacheable
    {
        auto req = make_req("GET", "/account");
        req.headers.emplace("Cookie", "cachebust_session=abc123");
        httplib::Response res;
        run(pipeline, req, res, 200, "text/html; charset=utf-8");
        expect_true("auth_page_no_cc", !res.has_header("Cache-Control"));
    }

    // Development: no-store survives, no override
    {
        const auto req = make_req("GET", "/css/app.css");
        httplib::Response res;
        run(dev_pipeline, req, res, 200, "text/css");
        expect_eq("dev_cc", res.get_header_value("Cache-Control"), "no-cache, no-store, must-revalidate");
        expect_eq("dev_pragma", res.get_header_value("Pragma"), "no-cache");
        expect_eq("dev_expires", res.get_header_value("Expires"), "0");
    }

    // API and health
    {
        const auto req = make_req("GET", "/api/assets/resolve");
        httplib::Response res;
        run(pipeline, req, res, 200, "application/json");
        expect_true("api_no_cc", !res.has_header("Cache-Control"));
        expect_true("api_keeps_legacy", res.has_header("X-XSS-Protection"));

        const auto hreq = make_req("GET", "/health");
        httplib::Response hres;
        run(pipeline, hreq, hres, 200, "application/json");
        expect_true("health_not_immutable",
                    hres.get_header_value("Cache-Control") != kImmutableAssetDirective &&
                    hres.get_header_value("Cache-Control") != kPageOverrideDirective);
    }

    // Redirect of a logical asset path must be revalidated, not kept for days
    {
        const auto req = make_req("GET", "/css/app.css");
        httplib::Response res;
        pipeline.before_routing(req, res);
        res.set_redirect("/css/app.1f3a9c0e.css", 302);
        pipeline.after_routing(req, res);
        expect_eq("redirect_cc", res.get_header_value("Cache-Control"), "no-cache");
        expect_true("redirect_cc_single", header_count(res, "Cache-Control") == 1);
        expect_eq("redirect_vary", res.get_header_value("Vary"), "Accept-Encoding");
    }

    // Same for a fingerprint that is not deployed yet
    {
        const auto req = make_req("GET", "/js/app.0badf00d.js");
        httplib::Response res;
        run(pipeline, req, res, 404, "text/plain; charset=utf-8");
        expect_eq("missing_static_cc", res.get_header_value("Cache-Control"), "no-cache");
        expect_true("missing_static_cc_single", header_count(res, "Cache-Control") == 1);
    }

    // POST is left alone
    {
        const auto req = make_req("POST", "/contact");
        httplib::Response res;
        run(pipeline, req, res, 200, "text/html");
        expect_true("post_no_cc", !res.has_header("Cache-Control"));
        expect_true("post_html_stripped", !res.has_header("X-XSS-Protection"));
    }

    // Throwing auth provider: request treated as anonymous
    {
        ResponsePipeline p(prod, [](const httplib::Request&) -> AuthPredicate {
            throw std::runtime_error("auth backend down");
        });
        const auto req = make_req("GET", "/about");
        httplib::Response res;
        run(p, req, res, 200, "text/html");
        expect_eq("auth_throw_cc", res.get_header_value("Cache-Control"), kPageOverrideDirective);
    }

    // Stripper signals
    {
        auto req = make_req("GET", "/download.bin");
        httplib::Response res;
        expect_true("strip_other_not_html", !LegacyHeaderStripper::is_html_response(req, res));
        res.set_header("Content-Type", "text/html");
        expect_true("strip_content_type", LegacyHeaderStripper::is_html_response(req, res));

        auto req2 = make_req("GET", "/feed.xml");
        req2.headers.emplace("Accept", "application/xhtml+xml");
        httplib::Response res2;
        expect_true("strip_accept", LegacyHeaderStripper::is_html_response(req2, res2));

        httplib::Response res3;
        ResponsePipeline::apply_security_headers(res3);
        expect_true("strip_count", LegacyHeaderStripper::strip(make_req("GET", "/about"), res3) == 3);
    }

    // Override layer on its own
    {
        BeforeSendHooks hooks;
        expect_true("attach_static", FinalOverrideLayer::attach("GET", "/a.png", hooks));
        expect_true("attach_api", !FinalOverrideLayer::attach("GET", "/api/a.png", hooks));
        expect_true("attach_health", !FinalOverrideLayer::attach("GET", "/health", hooks));
        expect_true("attach_post", !FinalOverrideLayer::attach("POST", "/a.png", hooks));
        expect_true("attach_other", !FinalOverrideLayer::attach("GET", "/robots.txt", hooks));
        expect_true("hooks_one", hooks.size() == 1);

        httplib::Response res;
        res.status = 404;
        res.set_header("Cache-Control", "no-store");
        hooks.run(res);
        expect_eq("override_skips_404", res.get_header_value("Cache-Control"), "no-store");
        expect_true("hooks_ran", hooks.ran());

        BeforeSendHooks hooks304;
        FinalOverrideLayer::attach("GET", "/a.png", hooks304);
        httplib::Response res304;
        res304.status = 304;
        res304.set_header("Cache-Control", "public, max-age=604800, stale-while-revalidate=86400");
        res304.set_header("Cache-Control", "private");
        hooks304.run(res304);
        expect_eq("override_304", res304.get_header_value("Cache-Control"), kImmutableAssetDirective);
        expect_true("override_304_single", header_count(res304, "Cache-Control") == 1);
    }

    // Session cookie predicate
    {
        auto req = make_req("GET", "/");
        std::string v;
        expect_true("cookie_none", !get_cookie_value(req, "cachebust_session", v));
        req.headers.emplace("Cookie", "xcachebust_session=nope; cachebust_session=yes; a=b");
        expect_true("cookie_found", get_cookie_value(req, "cachebust_session", v));
        expect_eq("cookie_value", v, "yes");
        expect_true("pred_true", session_cookie_predicate(req, "cachebust_session")());

        auto req2 = make_req("GET", "/");
        req2.headers.emplace("Cookie", "xcachebust_session=nope");
        expect_true("cookie_boundary", !get_cookie_value(req2, "cachebust_session", v));
        expect_true("pred_false", !session_cookie_predicate(req2, "cachebust_session")());

        auto req3 = make_req("GET", "/");
        req3.headers.emplace("Cookie", "cachebust_session=");
        expect_true("pred_empty_value", !session_cookie_predicate(req3, "cachebust_session")());
        expect_true("pred_no_name", !session_cookie_predicate(req3, ""));
    }

    // Static asset server
    {
        const fs::path pub = fs::temp_directory_path() /
                             ("cachebust_static_" + std::to_string((long)::getpid()));
        fs::remove_all(pub);
        fs::create_directories(pub / "css");
        {
            std::ofstream f(pub / "css" / "app.1f3a9c0e.css", std::ios::binary);
            f << "body{}";
        }
        {
            std::ofstream f(pub / "asset-manifest.json", std::ios::binary);
            f << "{\"css/app.css\": \"css/app.1f3a9c0e.css\"}";
        }

        ManifestStore store((pub / "asset-manifest.json").string(), pub.string());
        StaticAssetServer srv(pub.string(), store);

        {
            const auto req = make_req("GET", "/css/app.1f3a9c0e.css");
            httplib::Response res;
            srv.handle("css/app.1f3a9c0e.css", req, res);
            expect_true("serve_200", res.status == 200);
            expect_eq("serve_body", res.body, "body{}");
            expect_eq("serve_ct", res.get_header_value("Content-Type"), "text/css; charset=utf-8");
            expect_eq("serve_etag", res.get_header_value("ETag"), "\"css/app.1f3a9c0e.css\"");
        }
        {
            auto req = make_req("GET", "/css/app.1f3a9c0e.css");
            req.headers.emplace("If-None-Match", "\"css/app.1f3a9c0e.css\"");
            httplib::Response res;
            srv.handle("css/app.1f3a9c0e.css", req, res);
            expect_true("serve_304", res.status == 304);
        }
        // 304 from the server still leaves with the immutable directive
        {
            auto req = make_req("GET", "/css/app.1f3a9c0e.css");
            req.headers.emplace("If-None-Match", "\"css/app.1f3a9c0e.css\"");
            httplib::Response res;
            pipeline.before_routing(req, res);
            srv.handle("css/app.1f3a9c0e.css", req, res);
            pipeline.after_routing(req, res);
            expect_true("not_modified_status", res.status == 304);
            expect_eq("not_modified_cc", res.get_header_value("Cache-Control"), kImmutableAssetDirective);
            expect_true("not_modified_cc_single", header_count(res, "Cache-Control") == 1);
            expect_eq("not_modified_vary", res.get_header_value("Vary"), "Accept-Encoding");
        }
        // Logical path through the whole chain: 302 that is revalidated
        {
            const auto req = make_req("GET", "/css/app.css");
            httplib::Response res;
            pipeline.before_routing(req, res);
            srv.handle("css/app.css", req, res);
            pipeline.after_routing(req, res);
            expect_true("chain_302", res.status == 302);
            expect_eq("chain_302_cc", res.get_header_value("Cache-Control"), "no-cache");
        }
        {
            const auto req = make_req("GET", "/css/app.css");
            httplib::Response res;
            srv.handle("css/app.css", req, res);
            expect_true("serve_302", res.status == 302);
            expect_eq("serve_location", res.get_header_value("Location"), "/css/app.1f3a9c0e.css");
        }
        {
            const auto req = make_req("GET", "/css/none.css");
            httplib::Response res;
            srv.handle("css/none.css", req, res);
            expect_true("serve_404", res.status == 404);
        }
        {
            const auto req = make_req("GET", "/css/../asset-manifest.json");
            httplib::Response res;
            srv.handle("css/../asset-manifest.json", req, res);
            expect_true("serve_403", res.status == 403);
        }
        expect_true("relpath_ok", is_safe_static_relpath("govuk/fonts/a.woff2"));
        expect_true("relpath_abs", !is_safe_static_relpath("/etc/passwd"));
        expect_true("relpath_bs", !is_safe_static_relpath("css\\app.css"));
        expect_true("relpath_space", !is_safe_static_relpath("css/a b.css"));
        expect_eq("mime_woff2", mime_for_ext(".woff2"), "font/woff2");
        expect_eq("mime_unknown", mime_for_ext(".exe"), "");

        std::error_code ec;
        fs::remove_all(pub, ec);
    }

    if (failures) {
        std::fprintf(stderr, "[response_pipeline] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("OK: response pipeline tests passed\n");
    return 0;
}
