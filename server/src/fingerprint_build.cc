#include "fingerprint_build.h"
#include "cachebust_util.h"
#include "content_hasher.h"
#include "reference_rewriter.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>

namespace cachebust {

namespace {

struct RootAssets {
    const AssetRoot* root = nullptr;
    std::vector<Asset> assets;   // sorted by logical path
    bool aborted = false;
};

std::string output_path_for(const std::string& output_dir, const std::string& logical) {
    return (std::filesystem::path(output_dir) / logical).string();
}

void fail(BuildReport& rep, const std::string& msg) {
    std::cerr << "[build] ERROR: " << msg << std::endl;
    rep.failed++;
    rep.errors.push_back(msg);
}

// Pass 1 item. Returns false if the source could not be read.
bool process_plain(const Asset& a, const std::string& output_dir,
                   ManifestStore& store, NameMap& names, BuildReport& rep) {
    std::string body, err;
    if (!read_file_to_string(a.source_path, body, &err)) {
        fail(rep, "read " + a.source_path + ": " + err);
        return false;
    }

    if (a.origin == AssetOrigin::VENDORED && is_font(a.logical_path)) {
        if (!write_file_atomic(output_path_for(output_dir, a.logical_path), body, &err)) {
            fail(rep, "write " + a.logical_path + ": " + err);
            return true;
        }
        rep.copied++;
        return true;
    }

    try {
        const std::string fp_logical = fingerprinted_path(a.logical_path, fingerprint(body));
        if (!write_file_atomic(output_path_for(output_dir, fp_logical), body, &err)) {
            fail(rep, "write " + fp_logical + ": " + err);
            return true;
        }
        store.record(a.logical_path, fp_logical);
        names[a.logical_path] = fp_logical;
        rep.fingerprinted++;
    } catch (const std::exception& e) {
        fail(rep, a.logical_path + ": " + e.what());
    }
    return true;
}

// Pass 2 item, source already read.
void process_stylesheet(const Asset& a, const std::string& css, const std::string& output_dir,
                        ManifestStore& store, NameMap& names, BuildReport& rep) {
    const RewriteResult rr = ReferenceRewriter::rewrite(css, a.logical_path, names);
    if (rr.replaced > 0) rep.rewritten++;
    if (rr.unresolved > 0) {
        std::cerr << "[build] WARNING: " << a.logical_path << ": " << rr.unresolved
                  << " reference(s) left unchanged" << std::endl;
    }

    std::string err;
    try {
        // Hash after rewriting: a changed image must change the stylesheet URL too.
        const std::string fp_logical = fingerprinted_path(a.logical_path, fingerprint(rr.text));
        if (!write_file_atomic(output_path_for(output_dir, fp_logical), rr.text, &err)) {
            fail(rep, "write " + fp_logical + ": " + err);
            return;
        }
        store.record(a.logical_path, fp_logical);
        names[a.logical_path] = fp_logical;
        rep.fingerprinted++;
    } catch (const std::exception& e) {
        fail(rep, a.logical_path + ": " + e.what());
    }
}

struct Stylesheet {
    const Asset* asset = nullptr;
    std::string css;
};

void visit(size_t i, const std::vector<Stylesheet>& sheets,
           const std::map<std::string, size_t>& by_logical,
           std::vector<int>& state, std::vector<size_t>& order) {
    if (state[i] != 0) return;   // done, or on the stack (import cycle)
    state[i] = 1;
    for (const auto& t : ReferenceRewriter::targets(sheets[i].css, sheets[i].asset->logical_path)) {
        auto it = by_logical.find(t);
        if (it != by_logical.end()) visit(it->second, sheets, by_logical, state, order);
    }
    state[i] = 2;
    order.push_back(i);
}

// Imported stylesheets first, so their fingerprinted names are known when
// the importing stylesheet is rewritten. Cycles fall back to path order.
std::vector<size_t> import_order(const std::vector<Stylesheet>& sheets) {
    std::map<std::string, size_t> by_logical;
    for (size_t i = 0; i < sheets.size(); i++) by_logical[sheets[i].asset->logical_path] = i;

    std::vector<int> state(sheets.size(), 0);
    std::vector<size_t> order;
    for (size_t i = 0; i < sheets.size(); i++) visit(i, sheets, by_logical, state, order);
    return order;
}

void abort_root(RootAssets& ra, const std::string& source_path, BuildReport& rep) {
    std::cerr << "[build] ERROR: aborting root " << ra.root->dir
              << " after unreadable " << source_path << std::endl;
    ra.aborted = true;
    rep.aborted_roots++;
}

void run_group(AssetOrigin origin, const BuildConfig& cfg,
               ManifestStore& store, BuildReport& rep) {
    std::vector<RootAssets> group;
    for (const auto& root : cfg.roots) {
        if (root.origin != origin) continue;

        RootAssets ra;
        ra.root = &root;
        AssetCursor cur = AssetDiscovery::walk(root);
        Asset a;
        while (cur.next(&a)) ra.assets.push_back(a);
        std::sort(ra.assets.begin(), ra.assets.end(),
                  [](const Asset& x, const Asset& y) { return x.logical_path < y.logical_path; });
        group.push_back(std::move(ra));
    }

    NameMap names;

    // pass 1: everything a stylesheet may point at
    for (auto& ra : group) {
        for (const auto& a : ra.assets) {
            if (is_stylesheet(a.logical_path)) continue;
            if (process_plain(a, cfg.output_dir, store, names, rep)) continue;
            if (origin == AssetOrigin::APPLICATION) {
                abort_root(ra, a.source_path, rep);
                break;
            }
        }
    }

    // pass 2: stylesheets
    std::vector<Stylesheet> sheets;
    for (auto& ra : group) {
        if (ra.aborted) continue;
        for (const auto& a : ra.assets) {
            if (!is_stylesheet(a.logical_path)) continue;

            Stylesheet sh;
            sh.asset = &a;
            std::string err;
            if (read_file_to_string(a.source_path, sh.css, &err)) {
                sheets.push_back(std::move(sh));
                continue;
            }
            fail(rep, "read " + a.source_path + ": " + err);
            if (origin == AssetOrigin::APPLICATION) {
                abort_root(ra, a.source_path, rep);
                break;
            }
        }
    }

    for (size_t i : import_order(sheets)) {
        process_stylesheet(*sheets[i].asset, sheets[i].css, cfg.output_dir, store, names, rep);
    }
}

} // namespace

BuildReport FingerprintBuild::run(const BuildConfig& cfg, ManifestStore& store) {
    BuildReport rep;
    store.reset();

    run_group(AssetOrigin::APPLICATION, cfg, store, rep);
    run_group(AssetOrigin::VENDORED, cfg, store, rep);

    std::string err;
    if (store.persist(&err)) {
        rep.persisted = true;
    } else {
        const std::string msg = "persist " + store.path() + ": " + err;
        std::cerr << "[build] ERROR: " << msg << std::endl;
        rep.errors.push_back(msg);
    }

    std::cerr << "[build] " << rep.fingerprinted << " fingerprinted, "
              << rep.copied << " copied, " << rep.rewritten << " stylesheets rewritten, "
              << rep.failed << " failed" << std::endl;
    return rep;
}

} // namespace cachebust
