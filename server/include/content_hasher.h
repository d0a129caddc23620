#pragma once
#include <cstddef>
#include <string>

namespace cachebust {

/*
Content fingerprints
====================

A fingerprint is the first 8 lowercase hex characters of SHA-256(content).
It is a pure function of the bytes: path, mtime and process never enter it.
*/

constexpr std::size_t kFingerprintLen = 8;

std::string fingerprint(const std::string& bytes);

// Reads the file and fingerprints it. False (and *err) on I/O failure.
bool fingerprint_file(const std::string& path, std::string& out_fp, std::string* err = nullptr);

// "app.min.js" + fp -> "app.min.<fp>.js", "script" + fp -> "script.<fp>".
// Throws std::runtime_error if fp is empty (the name would not change).
std::string fingerprinted_name(const std::string& filename, const std::string& fp);

// Same transformation applied to the last segment of a logical path.
std::string fingerprinted_path(const std::string& logical_path, const std::string& fp);

} // namespace cachebust
