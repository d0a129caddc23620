#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "httplib.h"
#include "app_config.h"
#include "asset_manifest.h"
#include "asset_path_resolver.h"
#include "session_auth.h"
#include "cache_policy.h"
#include "cachebust_util.h"
#include "response_pipeline.h"
#include "static_serve.h"

using json = nlohmann::json;
using namespace cachebust;

// REPO_ROOT is derived from the running binary location:
// build/bin/cachebust_server  -> REPO_ROOT = build/bin/../../ = repo root
static const std::string REPO_ROOT = std::filesystem::weakly_canonical(
    std::filesystem::path(exe_dir()) / ".." / ".."
).string();

static void reply_json(httplib::Response& res, int code, const std::string& body_json) {
    res.status = code;
    res.set_header("Content-Type", "application/json");
    res.body = body_json;
}

static std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

// Landing page. Asset URLs go through the resolver so a rebuild changes them.
static std::string render_index(const AssetPathResolver& assets, const std::string& environment) {
    std::string html;
    html += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
    html += "<meta charset=\"utf-8\">\n<title>cachebust</title>\n";
    html += "<link rel=\"stylesheet\" href=\"" + html_escape(assets.url_for("css/app.css")) + "\">\n";
    html += "<link rel=\"icon\" type=\"image/svg+xml\" href=\"" + html_escape(assets.url_for("images/favicon.svg")) + "\">\n";
    html += "</head>\n<body>\n";
    html += "<main><h1>cachebust</h1><p>environment: " + html_escape(environment) + "</p></main>\n";
    html += "<script src=\"" + html_escape(assets.url_for("js/app.js")) + "\"></script>\n";
    html += "</body>\n</html>\n";
    return html;
}

int main()
{
    const AppConfig cfg = load_app_config(REPO_ROOT);

    ManifestStore manifest(cfg.manifest_path, cfg.public_dir);
    AssetPathResolver assets(manifest);
    CachePolicyEngine policy(make_cache_policy_config(cfg));

    const std::string cookie_name = cfg.session_cookie;
    ResponsePipeline pipeline(policy, [cookie_name](const httplib::Request& req) {
        return session_cookie_predicate(req, cookie_name);
    });

    StaticAssetServer static_assets(cfg.public_dir, manifest);

    httplib::Server srv;
    pipeline.install(srv);

    srv.Get("/", [&](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content(render_index(assets, policy.environment()), "text/html; charset=utf-8");
    });

    srv.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        json out = {
            {"ok", true},
            {"status", "ok"},
            {"environment", policy.environment()},
            {"manifest_entries", manifest.size()},
            {"ts", now_iso_utc()},
        };
        reply_json(res, 200, out.dump());
    });

    // GET /api/assets/resolve?path=css/app.css
    srv.Get("/api/assets/resolve", [&](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("path") || req.get_param_value("path").empty()) {
            reply_json(res, 400, json({{"ok", false}, {"error", "bad_request"},
                                       {"message", "missing path"}}).dump());
            return;
        }
        const std::string path = req.get_param_value("path");
        reply_json(res, 200, json({
            {"ok", true},
            {"path", path},
            {"resolved", assets.resolve(path)},
            {"url", assets.url_for(path)},
        }).dump());
    });

    // Must come AFTER the specific routes.
    static_assets.mount(srv);

    // Warm the manifest so a missing artifact is reported at startup.
    manifest.load();

    std::cerr << "[server] environment=" << policy.environment()
              << " public_dir=" << cfg.public_dir
              << " manifest=" << cfg.manifest_path << std::endl;
    std::cerr << "cachebust server listening on 0.0.0.0:" << cfg.listen_port << std::endl;
    if (!srv.listen("0.0.0.0", cfg.listen_port)) {
        std::cerr << "[server] ERROR: listen failed on port " << cfg.listen_port << std::endl;
        return 1;
    }
    return 0;
}
