#pragma once

// Workspace: the persistent home of one State/Lineage pair.
//   <dir>/state.json      current state (absent = initial empty object)
//   <dir>/lineage.jsonl   one JSON provenance item per line, append-only
//
// Arena: the per-run isolated directory tree holding workspaces, sandboxes
// and the staging copy of the package. Removed on destruction unless kept.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace furnace {

// Canonical state text, its byte size and digest. size is never below the
// length of the bytes on disk.
struct StateMeasure {
    std::string canonical;
    int64_t size{0};
    std::string digest; // "sha256:<hex>"
};

// Digest of a canonical document: "sha256:<hex>".
std::string state_digest(const std::string& canonical);

class Workspace {
public:
    Workspace() = default;
    explicit Workspace(std::filesystem::path dir) : dir_(std::move(dir)) {}

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path state_path() const { return dir_ / "state.json"; }
    std::filesystem::path lineage_path() const { return dir_ / "lineage.jsonl"; }

    // Create the directory (empty workspace).
    std::string init() const;

    bool has_state() const;

    // Canonicalize the persisted state. Absent state measures as "{}".
    // Unparsable state is an error.
    std::string measure_state(StateMeasure* out) const;

    // Replace state.json atomically (tmp + rename).
    std::string write_state(const std::string& json) const;

    std::string read_lineage(std::vector<std::string>* lines) const;
    std::string write_lineage(const std::vector<std::string>& lines) const;

    // Copy state and full lineage from another workspace.
    std::string copy_from(const Workspace& src) const;

    // Copy state and only the last `keep_last` lineage lines from src.
    std::string copy_truncated_from(const Workspace& src, size_t keep_last) const;

private:
    std::filesystem::path dir_;
};

class Arena {
public:
    // Creates <base>/run_<run_id>/{staging,workspaces,sandboxes}.
    static std::unique_ptr<Arena> create(const std::filesystem::path& base,
                                         const std::string& run_id,
                                         bool keep,
                                         std::string* err);
    ~Arena();
    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path staging_dir() const { return root_ / "staging"; }
    std::filesystem::path sandboxes_dir() const { return root_ / "sandboxes"; }
    std::filesystem::path workspaces_dir() const { return root_ / "workspaces"; }

    // Fresh, initialized workspace with a unique directory name.
    Workspace new_workspace(const std::string& name, std::string* err);

private:
    Arena(std::filesystem::path root, bool keep) : root_(std::move(root)), keep_(keep) {}

    std::filesystem::path root_;
    bool keep_{false};
    uint64_t seq_{0};
};

} // namespace furnace
