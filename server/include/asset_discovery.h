#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cachebust {

enum class AssetOrigin {
    APPLICATION,
    VENDORED,
};

const char* origin_name(AssetOrigin o);

// One source directory and how its files map into the public tree.
struct AssetRoot {
    std::string dir;                    // source directory on disk
    std::string public_prefix;          // e.g. "css", "govuk"; "" for the public root
    AssetOrigin origin = AssetOrigin::APPLICATION;
    std::vector<std::string> patterns;  // file-name wildcards; empty = everything
    bool recursive = true;
};

struct Asset {
    std::string source_path;   // absolute
    std::string logical_path;  // "<prefix>/<rel>", '/' separators, no leading '/'
    AssetOrigin origin = AssetOrigin::APPLICATION;
};

bool is_stylesheet(const std::string& path);
bool is_font(const std::string& path);

/*
AssetCursor
===========

Lazy sequence of the assets under one root: the directory is read entry by
entry as next() is called. Each AssetDiscovery::walk() starts a new walk of
the filesystem; no directory state is cached between walks.

Iteration order is the filesystem's. Callers that need a stable order sort
what they collect.
*/
class AssetCursor {
public:
    AssetCursor() = default;

    // Fills *out with the next matching regular file; false at the end.
    bool next(Asset* out);

private:
    friend class AssetDiscovery;

    AssetRoot root_;
    std::filesystem::path base_;
    std::filesystem::recursive_directory_iterator it_;
    bool started_ = false;
    bool done_ = true;
};

class AssetDiscovery {
public:
    // Missing or unreadable root: empty cursor plus a warning, never an error.
    static AssetCursor walk(const AssetRoot& root);

    static bool matches(const AssetRoot& root, const std::string& filename);
};

} // namespace cachebust
