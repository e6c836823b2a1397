#pragma once

// Artifact Loader.
//
// Validates the five-file package, parses manifest.json, and binds the
// interface contract by statically scanning mutation.py for top-level defs.
// Nothing from the artifact is executed here.

#include "furnace/contract.h"
#include "furnace/types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace furnace {

// manifest.json, schema.json, mutation.py, SELFTEST.py, README.md
const std::vector<std::string>& required_package_files();

struct ArtifactPackage {
    std::filesystem::path root;  // staged, validated copy (five files)
    std::string name;            // manifest "name" or the submission basename
    std::string artifact_id;     // "sha256:<hex>"
    std::string schema_digest;   // "sha256:<hex>" of schema.json (advisory)
    InterfaceContract contract;
};

struct LoadResult {
    bool ok{false};
    ReasonCode reason{ReasonCode::OK}; // FORMAT_INVALID / MANIFEST_INVALID / INTERNAL_ERROR
    Detail detail;                     // public-safe
    std::string internal;              // run log only
    ArtifactPackage pkg;               // artifact_id/name filled whenever computable
};

// `input` is a package directory or a .zip archive. `staging_dir` is a
// private directory the loader may populate (extraction + staged copy).
LoadResult load_package(const std::filesystem::path& input,
                        const std::filesystem::path& staging_dir);

// ---- exposed for tests ----

struct PyDef {
    std::string name;
    int required{0};        // positional params without default
    int total{0};           // all positional params
    bool varargs{false};    // *args present
    int kwonly_required{0}; // keyword-only params without default
};

// Top-level `def` statements in Python source, in order of appearance.
std::vector<PyDef> scan_top_level_defs(const std::string& source);

// True when `d` can be called with exactly n positional arguments.
bool accepts_arity(const PyDef& d, int n);

// Parse a manifest location ("func", "mutation.func", "mutation.py:func").
// Returns error string; on success *func holds the function name.
std::string parse_location(const std::string& loc, std::string* func);

} // namespace furnace
