#include "asset_discovery.h"
#include "cachebust_util.h"

#include <iostream>
#include <system_error>

#include <fnmatch.h>

namespace cachebust {

const char* origin_name(AssetOrigin o) {
    switch (o) {
        case AssetOrigin::APPLICATION: return "application";
        case AssetOrigin::VENDORED:    return "vendored";
    }
    return "application";
}

bool is_stylesheet(const std::string& path) {
    return ends_with_ci(path, ".css");
}

bool is_font(const std::string& path) {
    return ends_with_ci(path, ".woff") || ends_with_ci(path, ".woff2");
}

bool AssetDiscovery::matches(const AssetRoot& root, const std::string& filename) {
    if (root.patterns.empty()) return true;
    for (const auto& pat : root.patterns) {
        if (::fnmatch(pat.c_str(), filename.c_str(), 0) == 0) return true;
    }
    return false;
}

AssetCursor AssetDiscovery::walk(const AssetRoot& root) {
    AssetCursor c;
    c.root_ = root;

    std::error_code ec;
    const std::filesystem::path dir(root.dir);
    if (!std::filesystem::is_directory(dir, ec)) {
        std::cerr << "[discovery] WARNING: asset root not found, skipping: "
                  << root.dir << std::endl;
        return c;
    }

    c.base_ = std::filesystem::absolute(dir, ec);
    if (ec) c.base_ = dir;

    c.it_ = std::filesystem::recursive_directory_iterator(
        c.base_, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[discovery] WARNING: cannot read asset root " << root.dir
                  << ": " << ec.message() << std::endl;
        return c;
    }

    c.done_ = false;
    return c;
}

bool AssetCursor::next(Asset* out) {
    while (!done_) {
        std::error_code ec;
        if (started_) {
            it_.increment(ec);
            if (ec) {
                std::cerr << "[discovery] WARNING: walk of " << root_.dir
                          << " stopped early: " << ec.message() << std::endl;
                done_ = true;
                return false;
            }
        }
        started_ = true;

        if (it_ == std::filesystem::recursive_directory_iterator()) {
            done_ = true;
            return false;
        }

        const auto& entry = *it_;
        if (entry.is_directory(ec)) {
            if (!root_.recursive) it_.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;

        const std::string name = entry.path().filename().string();
        if (!AssetDiscovery::matches(root_, name)) continue;

        const std::string rel = to_logical_path(entry.path().lexically_relative(base_).generic_string());
        const std::string prefix = trim_slashes(to_logical_path(root_.public_prefix));

        out->source_path = entry.path().string();
        out->logical_path = prefix.empty() ? rel : prefix + "/" + rel;
        out->origin = root_.origin;
        return true;
    }
    return false;
}

} // namespace cachebust
