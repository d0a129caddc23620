#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "asset_discovery.h"
#include "asset_manifest.h"

namespace cachebust {

struct BuildConfig {
    std::string output_dir;          // public root the fingerprinted files go to
    std::vector<AssetRoot> roots;
};

struct BuildReport {
    std::size_t fingerprinted = 0;   // written under a fingerprinted name + manifest entry
    std::size_t copied = 0;          // vendored fonts copied verbatim
    std::size_t rewritten = 0;       // stylesheets whose references changed
    std::size_t failed = 0;          // per-file failures
    std::size_t aborted_roots = 0;   // application roots cut short by an unreadable file
    bool persisted = false;
    std::vector<std::string> errors;

    bool ok() const { return persisted && failed == 0 && aborted_roots == 0; }
};

/*
FingerprintBuild
================

One build run:

  store.reset()
  for origin group in (application, vendored):
      pass 1: every non-stylesheet asset
      pass 2: every stylesheet, imported ones first, references rewritten
              against the names produced so far in this group
  store.persist()

Each asset is read, (rewritten), fingerprinted from its final bytes, written to
<output_dir>/<fingerprinted logical path> and recorded in the store.

Vendored .woff/.woff2 files already carry upstream hashes: they are copied to
<output_dir>/<logical path> and get no manifest entry.

Failure handling:
  - unreadable application asset: logged, the rest of that root is skipped
  - unreadable vendored asset:    logged, skipped
  - write failure:                logged, counted for that file
  - persist failure:              report is not ok()

Callers serialize builds; the store is the only shared state.
*/
class FingerprintBuild {
public:
    static BuildReport run(const BuildConfig& cfg, ManifestStore& store);
};

} // namespace cachebust
