#pragma once
#include <string>

namespace cachebust {

class ManifestStore;

// Runtime façade used by page rendering to emit cache-busted asset URLs.
// Read-only against the store; safe to share between request threads.
class AssetPathResolver {
public:
    explicit AssetPathResolver(ManifestStore& store) : store_(store) {}

    // "css/app.css" or "/css/app.css" -> "css/app.1f3a9c0e.css".
    // Unknown paths come back normalized (no leading '/').
    std::string resolve(const std::string& logical_path) const;

    // resolve() as an absolute URL path: "/css/app.1f3a9c0e.css".
    std::string url_for(const std::string& logical_path) const;

private:
    ManifestStore& store_;
};

} // namespace cachebust
