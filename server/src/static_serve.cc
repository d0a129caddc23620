#include "static_serve.h"
#include "cachebust_util.h"
#include "route_class.h"

#include <filesystem>
#include <system_error>

namespace cachebust {

bool is_safe_static_relpath(const std::string& rel) {
    if (rel.empty()) return false;
    if (rel.find('\0') != std::string::npos) return false;

    // No absolute paths, no traversal, no backslashes (Windows), no "//"
    if (rel[0] == '/' || rel.find("..") != std::string::npos) return false;
    if (rel.find('\\') != std::string::npos) return false;
    if (rel.find("//") != std::string::npos) return false;

    for (char c : rel) {
        const bool ok =
            (c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '.' || c == '_' || c == '-' || c == '/' ;
        if (!ok) return false;
    }

    return true;
}

std::string mime_for_ext(std::string ext) {
    if (ext == ".html")  return "text/html; charset=utf-8";
    if (ext == ".js")    return "application/javascript; charset=utf-8";
    if (ext == ".css")   return "text/css; charset=utf-8";
    if (ext == ".map")   return "application/json; charset=utf-8";
    if (ext == ".svg")   return "image/svg+xml; charset=utf-8";
    if (ext == ".png")   return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".webp")  return "image/webp";
    if (ext == ".avif")  return "image/avif";
    if (ext == ".gif")   return "image/gif";
    if (ext == ".ico")   return "image/x-icon";
    if (ext == ".woff")  return "font/woff";
    if (ext == ".woff2") return "font/woff2";
    if (ext == ".ttf")   return "font/ttf";
    if (ext == ".eot")   return "application/vnd.ms-fontobject";
    return "";
}

static void reply_text(httplib::Response& res, int code, const std::string& body) {
    res.status = code;
    res.set_content(body, "text/plain; charset=utf-8");
}

StaticAssetServer::StaticAssetServer(std::string public_dir, ManifestStore& store)
    : public_dir_(std::move(public_dir)), store_(store) {}

void StaticAssetServer::handle(const std::string& rel,
                               const httplib::Request& req,
                               httplib::Response& res) const {
    if (!is_safe_static_relpath(rel)) {
        reply_text(res, 403, "Forbidden");
        return;
    }

    const std::filesystem::path full = std::filesystem::path(public_dir_) / rel;
    const std::string ct = mime_for_ext(lower_ascii(full.extension().string()));
    if (ct.empty()) {
        reply_text(res, 404, "Not found");
        return;
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(full, ec)) {
        std::string body;
        if (!read_file_to_string(full.string(), body)) {
            reply_text(res, 404, "Not found");
            return;
        }

        // Fingerprinted names are content-addressed, so the path is a valid validator.
        const std::string etag = "\"" + rel + "\"";
        res.set_header("ETag", etag);
        if (req.get_header_value("If-None-Match") == etag) {
            res.status = 304;
            return;
        }

        res.status = 200;
        res.set_content(std::move(body), ct);
        return;
    }

    const std::string mapped = store_.lookup(rel);
    if (mapped != rel && is_safe_static_relpath(mapped)) {
        res.set_redirect("/" + mapped, 302);
        return;
    }

    reply_text(res, 404, "Not found");
}

void StaticAssetServer::mount(httplib::Server& srv) const {
    srv.Get(R"(/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (req.matches.size() < 2) {
            reply_text(res, 400, "Bad static request");
            return;
        }
        if (classify_route(req.path) != RouteClass::STATIC_ASSET) {
            reply_text(res, 404, "Not found");
            return;
        }
        handle(req.matches[1].str(), req, res);
    });
}

} // namespace cachebust
