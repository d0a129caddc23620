#include "http_headers.h"

namespace cachebust {

void replace_header(httplib::Response& res, const std::string& key, const std::string& value) {
    res.headers.erase(key);
    res.set_header(key, value);
}

void remove_header(httplib::Response& res, const std::string& key) {
    res.headers.erase(key);
}

size_t header_count(const httplib::Response& res, const std::string& key) {
    return res.headers.count(key);
}

} // namespace cachebust
