#pragma once
#include <string>

namespace cachebust {

/*
Route classification
====================

The one place that decides what a request path is. The cache policy, the
legacy header stripper and the final override all consume this instead of
keeping their own prefix/extension lists.

  API          "/api" or anything under "/api/"
  HEALTH       "/health" or anything under "/health/"
  STATIC_ASSET last segment ends in a known asset extension (case-insensitive)
  HTML_PAGE    no '.' anywhere in the path ("/" included)
  OTHER        everything else ("/robots.txt", "/feed.xml")
*/
enum class RouteClass {
    API,
    HEALTH,
    STATIC_ASSET,
    HTML_PAGE,
    OTHER,
};

RouteClass classify_route(const std::string& path);
const char* route_class_name(RouteClass c);

bool has_static_asset_ext(const std::string& path);

// GET and HEAD: the only methods whose responses are cacheable here.
bool is_safe_read_method(const std::string& method);

} // namespace cachebust
