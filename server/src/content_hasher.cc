#include "content_hasher.h"
#include "cachebust_util.h"

#include <stdexcept>

#include <openssl/sha.h>

namespace cachebust {

static std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

std::string fingerprint(const std::string& bytes) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), h);
    return to_hex(h, kFingerprintLen / 2);
}

bool fingerprint_file(const std::string& path, std::string& out_fp, std::string* err) {
    std::string body;
    if (!read_file_to_string(path, body, err)) return false;
    out_fp = fingerprint(body);
    return true;
}

std::string fingerprinted_name(const std::string& filename, const std::string& fp) {
    if (fp.empty()) {
        throw std::runtime_error("empty fingerprint for " + filename);
    }

    // A leading dot marks a hidden file, not an extension.
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return filename + "." + fp;
    }
    return filename.substr(0, dot) + "." + fp + filename.substr(dot);
}

std::string fingerprinted_path(const std::string& logical_path, const std::string& fp) {
    const auto slash = logical_path.rfind('/');
    if (slash == std::string::npos) return fingerprinted_name(logical_path, fp);
    return logical_path.substr(0, slash + 1) +
           fingerprinted_name(logical_path.substr(slash + 1), fp);
}

} // namespace cachebust
