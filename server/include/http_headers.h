#pragma once
#include <string>

#include "httplib.h"

namespace cachebust {

// httplib's set_header() appends; these replace.
void replace_header(httplib::Response& res, const std::string& key, const std::string& value);
void remove_header(httplib::Response& res, const std::string& key);

// Number of values present for `key` (case-insensitive).
size_t header_count(const httplib::Response& res, const std::string& key);

} // namespace cachebust
