#pragma once

// In-sandbox call shim.
//
// A small Python program the harness writes into every sandbox. It imports
// the artifact module from the read-only app dir, resolves the bound
// functions, performs exactly one operation against a workspace and writes a
// JSON result file:
//
//   <runtime> -s -B shim.py <op> <app_dir> <workspace_dir> <request.json> <result.json>
//
//   op: version | import | ingest | compact | audit
//   result: {"status": ok|raised|malformed|unserializable|lineage_mutated|resource|harness,
//            "detail": str, "audit": {"verdict": "OK"|"HALT", "reason": str},
//            "checkpoints": [canonical state text, ...], "count": n, "version": "x.y.z"}
//
// Artifact exceptions never escape the shim; a missing result file means the
// interpreter itself died.

#include <filesystem>
#include <string>

namespace furnace {

const std::string& shim_source();

// Write the shim to `dst` (read-only). Returns error string.
std::string write_shim(const std::filesystem::path& dst);

} // namespace furnace
