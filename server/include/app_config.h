#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "asset_discovery.h"
#include "cache_policy.h"

namespace cachebust {

/*
AppConfig
=========

Process configuration, resolved in three layers (later wins):

  1. built-in defaults (paths relative to the repo root)
  2. JSON settings file (config/cachebust_settings.json or CACHEBUST_SETTINGS_PATH)
  3. environment variables:
       CACHEBUST_ENV              development | production | ...
       CACHEBUST_LISTEN_PORT
       CACHEBUST_PUBLIC_DIR       directory served and written by the build
       CACHEBUST_MANIFEST_PATH    defaults to <public_dir>/asset-manifest.json
       CACHEBUST_SESSION_COOKIE   cookie whose presence marks a request as authenticated

Settings file layout:

  {
    "environment": "production",
    "cache": {
      "max_age": 3600,
      "static_assets": { "max_age": 604800, "stale_while_revalidate": 86400 },
      "pages":         { "max_age": 3600,   "stale_while_revalidate": 60 }
    },
    "build": {
      "output_dir": "dist/public",
      "roots": [
        { "dir": "frontend/css", "prefix": "css", "origin": "application",
          "patterns": ["*.css", "*.map"], "recursive": true }
      ]
    }
  }

Relative paths in the file are resolved against the repo root.
*/
struct AppConfig {
    std::string repo_root;
    std::string settings_path;

    std::string environment = "production";
    int listen_port = 8080;
    std::string public_dir;
    std::string manifest_path;
    std::string session_cookie = "cachebust_session";

    // Raw "cache" section; read through lookup_cache_seconds().
    nlohmann::json cache = nlohmann::json::object();

    std::string build_output_dir;
    std::vector<AssetRoot> build_roots;
};

// Defaults for a repo rooted at `repo_root`.
AppConfig default_app_config(const std::string& repo_root);

// Merges the settings file into cfg. A missing file is not an error (returns
// true, cfg unchanged); malformed content returns false with *err.
bool load_settings_file(const std::string& path, AppConfig& cfg, std::string* err = nullptr);

void apply_env_overrides(AppConfig& cfg);

// defaults -> settings file -> env. Settings problems are logged, never fatal.
AppConfig load_app_config(const std::string& repo_root);

// Dotted lookup in the "cache" section ("pages.max_age").
// nullopt when absent; throws std::runtime_error when present but not an integer.
std::optional<long> lookup_cache_seconds(const nlohmann::json& cache, const std::string& dotted_key);

// Environment is re-read from CACHEBUST_ENV on every call so a running server
// follows the process environment; the configured value is the fallback.
CachePolicyConfig make_cache_policy_config(const AppConfig& cfg);

bool parse_origin(const std::string& s, AssetOrigin* out);

} // namespace cachebust
