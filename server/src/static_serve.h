#pragma once
#include "httplib.h"
#include "asset_manifest.h"

#include <string>

namespace cachebust {

// Relative path under the public dir: no traversal, no absolute path, no
// backslash, no "//", only [A-Za-z0-9._-/].
bool is_safe_static_relpath(const std::string& rel);

// ext lowercase with dot (".png"); "" for anything not served.
std::string mime_for_ext(std::string ext);

/*
Serves the public directory at /<path> for static-asset shaped paths.

  file present                        -> 200 (304 on a matching If-None-Match)
  file absent, manifest has a mapping -> 302 to the fingerprinted URL
  otherwise                           -> 404

Cache headers are left to the response pipeline.
*/
class StaticAssetServer {
public:
    StaticAssetServer(std::string public_dir, ManifestStore& store);

    void handle(const std::string& rel, const httplib::Request& req, httplib::Response& res) const;

    // Registers the catch-all GET route. Call after the specific routes.
    void mount(httplib::Server& srv) const;

private:
    std::string public_dir_;
    ManifestStore& store_;
};

} // namespace cachebust
