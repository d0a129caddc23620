#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace cachebust {

/*
AssetManifest
=============

Immutable mapping logical path -> fingerprinted logical path, e.g.

  "css/app.css" -> "css/app.1f3a9c0e.css"

Both sides are public-root relative with '/' separators and no leading '/'.
Instances are shared between request threads through
shared_ptr<const AssetManifest> and never change after construction.
*/
class AssetManifest {
public:
    AssetManifest() = default;
    explicit AssetManifest(std::map<std::string, std::string> entries);

    // Strips one leading '/'. Returns the fingerprinted path, or `logical_path`
    // unchanged when there is no entry.
    std::string lookup(const std::string& logical_path) const;
    bool contains(const std::string& logical_path) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::map<std::string, std::string>& entries() const { return entries_; }

private:
    std::map<std::string, std::string> entries_;
};

/*
ManifestStore
=============

Owns the manifest for one process.

Build phase (single writer, one fingerprinting run at a time):
  reset() -> record()... -> persist()

Runtime phase (many concurrent readers):
  load() happens lazily on the first lookup()/snapshot(); after that the
  manifest is only read. A missing or corrupt artifact degrades to an empty
  manifest (every path resolves to itself) and is logged once.

When a public root is given, entries whose fingerprinted file is missing on
disk are dropped at load time, so a stale manifest falls back to logical paths
instead of pointing at files that no longer exist.
*/
class ManifestStore {
public:
    explicit ManifestStore(std::string manifest_path, std::string public_root = "");

    ManifestStore(const ManifestStore&) = delete;
    ManifestStore& operator=(const ManifestStore&) = delete;

    // Build phase
    void reset();
    void record(const std::string& logical_path, const std::string& fingerprinted_path);
    bool persist(std::string* err = nullptr) const;

    // Runtime phase
    void load();
    void invalidate();
    std::string lookup(const std::string& logical_path);
    std::shared_ptr<const AssetManifest> snapshot();

    bool loaded() const;
    std::size_t size();
    const std::string& path() const { return manifest_path_; }

    // Serialized form of the artifact (sorted keys, 2-space indent).
    static std::string to_json(const std::map<std::string, std::string>& entries);

    // Parses an artifact body. False (and *err) on malformed input.
    static bool parse_json(const std::string& body,
                           std::map<std::string, std::string>& out,
                           std::string* err);

private:
    std::string manifest_path_;
    std::string public_root_;

    // Guards every member below. load() runs under it, so concurrent first
    // lookups read the artifact once.
    mutable std::mutex mu_;
    std::map<std::string, std::string> entries_;
    std::shared_ptr<const AssetManifest> snapshot_;
    bool loaded_ = false;
    bool warned_ = false;

    void load_locked_();
    std::shared_ptr<const AssetManifest> snapshot_locked_();
    void warn_once_locked_(const std::string& msg);
};

} // namespace cachebust
