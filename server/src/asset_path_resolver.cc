#include "asset_path_resolver.h"
#include "asset_manifest.h"
#include "cachebust_util.h"

namespace cachebust {

std::string AssetPathResolver::resolve(const std::string& logical_path) const {
    const std::string normalized = strip_leading_slash(logical_path);
    store_.load();
    return store_.lookup(normalized);
}

std::string AssetPathResolver::url_for(const std::string& logical_path) const {
    return "/" + resolve(logical_path);
}

} // namespace cachebust
