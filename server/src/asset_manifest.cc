#include "asset_manifest.h"
#include "cachebust_util.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <system_error>

using json = nlohmann::json;

namespace cachebust {

/*
Manifest artifact
=================

One flat JSON object, written by the fingerprinting build and read by the
server:

  {
    "css/app.css": "css/app.1f3a9c0e.css",
    "js/main.js": "js/main.77b0d412.js"
  }

The artifact is always replaced as a whole (tmp + rename). A reader sees the
previous complete manifest or the new complete manifest, never a mix.
*/

AssetManifest::AssetManifest(std::map<std::string, std::string> entries)
    : entries_(std::move(entries)) {}

std::string AssetManifest::lookup(const std::string& logical_path) const {
    auto it = entries_.find(strip_leading_slash(logical_path));
    if (it == entries_.end()) return logical_path;
    return it->second;
}

bool AssetManifest::contains(const std::string& logical_path) const {
    return entries_.count(strip_leading_slash(logical_path)) != 0;
}

ManifestStore::ManifestStore(std::string manifest_path, std::string public_root)
    : manifest_path_(std::move(manifest_path)), public_root_(std::move(public_root)) {}

// A new build starts from nothing; the artifact on disk belongs to the
// previous build and must not be merged back in.
void ManifestStore::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
    snapshot_.reset();
    loaded_ = true;
}

void ManifestStore::record(const std::string& logical_path, const std::string& fingerprinted_path) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_[strip_leading_slash(logical_path)] = strip_leading_slash(fingerprinted_path);
    snapshot_.reset();
}

std::string ManifestStore::to_json(const std::map<std::string, std::string>& entries) {
    json j = json::object();
    for (const auto& kv : entries) j[kv.first] = kv.second;
    return j.dump(2) + "\n";
}

bool ManifestStore::parse_json(const std::string& body,
                               std::map<std::string, std::string>& out,
                               std::string* err) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        if (err) *err = std::string("parse error: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        if (err) *err = "invalid format (expected a JSON object)";
        return false;
    }

    std::map<std::string, std::string> tmp;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) continue;
        const std::string key = strip_leading_slash(it.key());
        const std::string val = strip_leading_slash(it.value().get<std::string>());
        if (key.empty() || val.empty()) continue;
        tmp[key] = val;
    }
    out.swap(tmp);
    return true;
}

bool ManifestStore::persist(std::string* err) const {
    std::string body;
    {
        std::lock_guard<std::mutex> lk(mu_);
        body = to_json(entries_);
    }
    return write_file_atomic(manifest_path_, body, err);
}

void ManifestStore::warn_once_locked_(const std::string& msg) {
    if (warned_) return;
    warned_ = true;
    std::cerr << "[manifest] WARNING: " << msg << std::endl;
}

void ManifestStore::load_locked_() {
    if (loaded_) return;
    loaded_ = true;
    entries_.clear();
    snapshot_.reset();

    std::error_code ec;
    if (!std::filesystem::exists(manifest_path_, ec)) {
        warn_once_locked_("asset manifest not found, serving logical paths: " + manifest_path_);
        return;
    }

    std::string body;
    std::string err;
    if (!read_file_to_string(manifest_path_, body, &err)) {
        warn_once_locked_("asset manifest unreadable, serving logical paths: " + err);
        return;
    }

    std::map<std::string, std::string> parsed;
    if (!parse_json(body, parsed, &err)) {
        warn_once_locked_("asset manifest " + manifest_path_ + " is corrupt (" + err +
                          "), serving logical paths");
        return;
    }

    if (!public_root_.empty()) {
        size_t dropped = 0;
        for (auto it = parsed.begin(); it != parsed.end();) {
            const auto file = std::filesystem::path(public_root_) / it->second;
            if (!std::filesystem::is_regular_file(file, ec)) {
                it = parsed.erase(it);
                dropped++;
            } else {
                ++it;
            }
        }
        if (dropped > 0) {
            std::cerr << "[manifest] WARNING: dropped " << dropped
                      << " entries whose fingerprinted file is missing under "
                      << public_root_ << std::endl;
        }
    }

    entries_.swap(parsed);
    std::cerr << "[manifest] loaded " << entries_.size() << " entries from "
              << manifest_path_ << std::endl;
}

void ManifestStore::load() {
    std::lock_guard<std::mutex> lk(mu_);
    load_locked_();
}

void ManifestStore::invalidate() {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
    snapshot_.reset();
    loaded_ = false;
    warned_ = false;
}

std::shared_ptr<const AssetManifest> ManifestStore::snapshot_locked_() {
    load_locked_();
    if (!snapshot_) snapshot_ = std::make_shared<const AssetManifest>(entries_);
    return snapshot_;
}

std::shared_ptr<const AssetManifest> ManifestStore::snapshot() {
    std::lock_guard<std::mutex> lk(mu_);
    return snapshot_locked_();
}

std::string ManifestStore::lookup(const std::string& logical_path) {
    return snapshot()->lookup(logical_path);
}

bool ManifestStore::loaded() const {
    std::lock_guard<std::mutex> lk(mu_);
    return loaded_;
}

std::size_t ManifestStore::size() {
    return snapshot()->size();
}

} // namespace cachebust
