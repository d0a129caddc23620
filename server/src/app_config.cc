#include "app_config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace cachebust {

static std::string resolve_against(const std::string& base, const std::string& p) {
    if (p.empty()) return p;
    std::filesystem::path fp(p);
    if (fp.is_absolute()) return p;
    return (std::filesystem::path(base) / fp).lexically_normal().string();
}

AppConfig default_app_config(const std::string& repo_root) {
    AppConfig cfg;
    cfg.repo_root = repo_root;
    cfg.settings_path =
        (std::filesystem::path(repo_root) / "config" / "cachebust_settings.json").string();
    cfg.public_dir = (std::filesystem::path(repo_root) / "dist" / "public").string();
    cfg.manifest_path = (std::filesystem::path(cfg.public_dir) / "asset-manifest.json").string();
    cfg.build_output_dir = cfg.public_dir;
    return cfg;
}

bool parse_origin(const std::string& s, AssetOrigin* out) {
    if (s == "application") { *out = AssetOrigin::APPLICATION; return true; }
    if (s == "vendored")    { *out = AssetOrigin::VENDORED; return true; }
    return false;
}

static bool parse_root(const json& jr, const std::string& base, AssetRoot& out, std::string* err) {
    if (!jr.is_object()) {
        if (err) *err = "build.roots entry is not an object";
        return false;
    }

    auto dit = jr.find("dir");
    if (dit == jr.end() || !dit->is_string() || dit->get<std::string>().empty()) {
        if (err) *err = "build.roots entry missing dir";
        return false;
    }
    out.dir = resolve_against(base, dit->get<std::string>());

    auto pit = jr.find("prefix");
    if (pit != jr.end() && pit->is_string()) out.public_prefix = pit->get<std::string>();

    auto oit = jr.find("origin");
    if (oit != jr.end()) {
        if (!oit->is_string() || !parse_origin(oit->get<std::string>(), &out.origin)) {
            if (err) *err = "build.roots entry has invalid origin (application|vendored)";
            return false;
        }
    }

    auto patit = jr.find("patterns");
    if (patit != jr.end()) {
        if (!patit->is_array()) {
            if (err) *err = "build.roots patterns must be an array";
            return false;
        }
        for (const auto& p : *patit) {
            if (p.is_string()) out.patterns.push_back(p.get<std::string>());
        }
    }

    auto rit = jr.find("recursive");
    if (rit != jr.end() && rit->is_boolean()) out.recursive = rit->get<bool>();
    return true;
}

bool load_settings_file(const std::string& path, AppConfig& cfg, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) return true;

    json j;
    try {
        j = json::parse(f, nullptr, true);
    } catch (const json::exception& e) {
        if (err) *err = std::string("parse error: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "invalid format (expected a JSON object)";
        return false;
    }

    // Parse into a copy; cfg only changes when the whole file is valid.
    AppConfig next = cfg;

    auto eit = j.find("environment");
    if (eit != j.end() && eit->is_string()) next.environment = eit->get<std::string>();

    auto cit = j.find("cache");
    if (cit != j.end()) {
        if (!cit->is_object()) {
            if (err) *err = "cache must be an object";
            return false;
        }
        next.cache = *cit;
    }

    auto bit = j.find("build");
    if (bit != j.end()) {
        if (!bit->is_object()) {
            if (err) *err = "build must be an object";
            return false;
        }
        auto oit = bit->find("output_dir");
        if (oit != bit->end() && oit->is_string()) {
            next.build_output_dir = resolve_against(cfg.repo_root, oit->get<std::string>());
        }
        auto rit = bit->find("roots");
        if (rit != bit->end()) {
            if (!rit->is_array()) {
                if (err) *err = "build.roots must be an array";
                return false;
            }
            next.build_roots.clear();
            for (const auto& jr : *rit) {
                AssetRoot r;
                if (!parse_root(jr, cfg.repo_root, r, err)) return false;
                next.build_roots.push_back(std::move(r));
            }
        }
    }

    cfg = std::move(next);
    return true;
}

void apply_env_overrides(AppConfig& cfg) {
    if (const char* v = std::getenv("CACHEBUST_ENV")) cfg.environment = v;
    if (const char* v = std::getenv("CACHEBUST_LISTEN_PORT")) {
        const int port = std::atoi(v);
        if (port > 0 && port < 65536) {
            cfg.listen_port = port;
        } else {
            std::cerr << "[config] WARNING: ignoring invalid CACHEBUST_LISTEN_PORT=" << v << std::endl;
        }
    }

    const std::string old_public_dir = cfg.public_dir;
    if (const char* v = std::getenv("CACHEBUST_PUBLIC_DIR")) {
        cfg.public_dir = v;
        // Manifest and build output follow the public dir unless set explicitly.
        if (cfg.build_output_dir == old_public_dir) cfg.build_output_dir = cfg.public_dir;
        cfg.manifest_path =
            (std::filesystem::path(cfg.public_dir) / "asset-manifest.json").string();
    }
    if (const char* v = std::getenv("CACHEBUST_MANIFEST_PATH")) cfg.manifest_path = v;
    if (const char* v = std::getenv("CACHEBUST_SESSION_COOKIE")) cfg.session_cookie = v;
}

AppConfig load_app_config(const std::string& repo_root) {
    AppConfig cfg = default_app_config(repo_root);
    if (const char* p = std::getenv("CACHEBUST_SETTINGS_PATH")) cfg.settings_path = p;

    std::string err;
    if (!load_settings_file(cfg.settings_path, cfg, &err)) {
        std::cerr << "[settings] WARNING: " << cfg.settings_path << ": " << err
                  << " (using defaults)" << std::endl;
    }

    apply_env_overrides(cfg);
    return cfg;
}

std::optional<long> lookup_cache_seconds(const json& cache, const std::string& dotted_key) {
    const json* cur = &cache;
    size_t start = 0;
    while (true) {
        const size_t dot = dotted_key.find('.', start);
        const std::string part = dotted_key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (!cur->is_object()) return std::nullopt;
        auto it = cur->find(part);
        if (it == cur->end() || it->is_null()) return std::nullopt;
        cur = &(*it);

        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    if (!cur->is_number_integer()) {
        throw std::runtime_error("cache." + dotted_key + " is not an integer");
    }
    return cur->get<long>();
}

CachePolicyConfig make_cache_policy_config(const AppConfig& cfg) {
    CachePolicyConfig pc;
    const std::string configured = cfg.environment;
    pc.environment = [configured]() {
        if (const char* v = std::getenv("CACHEBUST_ENV")) return std::string(v);
        return configured;
    };
    const json cache = cfg.cache;
    pc.lookup_seconds = [cache](const std::string& key) {
        return lookup_cache_seconds(cache, key);
    };
    return pc;
}

} // namespace cachebust
