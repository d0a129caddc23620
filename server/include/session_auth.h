#pragma once

#include <string>

#include "httplib.h"
#include "cache_policy.h"

namespace cachebust {

// Extracts a cookie value from the "Cookie" header. Simple name=value pairs
// only; no quoted values.
bool get_cookie_value(const httplib::Request& req, const std::string& name, std::string& out);

// "Is this request authenticated?" as far as caching is concerned: a
// non-empty session cookie is present. The cookie is not verified here; the
// cache layer only needs to know the response may be personalized.
AuthPredicate session_cookie_predicate(const httplib::Request& req, const std::string& cookie_name);

} // namespace cachebust
