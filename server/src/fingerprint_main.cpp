#include <filesystem>
#include <iostream>
#include <string>

#include "app_config.h"
#include "asset_manifest.h"
#include "cachebust_util.h"
#include "fingerprint_build.h"

using namespace cachebust;

// build/bin/cachebust_fingerprint -> repo root two levels up
static const std::string REPO_ROOT = std::filesystem::weakly_canonical(
    std::filesystem::path(exe_dir()) / ".." / ".."
).string();

/*
cachebust_fingerprint
=====================

Fingerprints every configured asset root into the public directory and
writes the manifest. Configuration comes from the same settings file and
CACHEBUST_* variables as the server.

Exit status: 0 on success, 1 if any asset failed or the manifest could not be
written, 2 if nothing is configured.
*/
int main()
{
    const AppConfig cfg = load_app_config(REPO_ROOT);

    if (cfg.build_roots.empty()) {
        std::cerr << "[build] ERROR: no asset roots configured (build.roots in "
                  << cfg.settings_path << ")" << std::endl;
        return 2;
    }

    BuildConfig bc;
    bc.output_dir = cfg.build_output_dir;
    bc.roots = cfg.build_roots;

    ManifestStore store(cfg.manifest_path);

    std::cerr << "[build] output=" << bc.output_dir << " manifest=" << store.path()
              << " roots=" << bc.roots.size() << std::endl;
    for (const auto& r : bc.roots) {
        std::cerr << "[build] root " << r.dir << " -> /" << r.public_prefix
                  << " (" << origin_name(r.origin) << ")" << std::endl;
    }

    const BuildReport rep = FingerprintBuild::run(bc, store);
    if (!rep.ok()) {
        std::cerr << "[build] FAILED with " << rep.errors.size() << " error(s)" << std::endl;
        return 1;
    }

    std::cerr << "[build] OK: manifest written to " << store.path() << std::endl;
    return 0;
}
