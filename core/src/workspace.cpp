#include "furnace/workspace.h"
#include "furnace/fsutil.h"
#include "furnace/hash.h"
#include "furnace/json_mini.h"
#include "furnace/sandbox.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace furnace {

std::string state_digest(const std::string& canonical) {
    return "sha256:" + hash::sha256_hex(canonical);
}

std::string Workspace::init() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) return "workspace mkdir: " + ec.message();
    return "";
}

bool Workspace::has_state() const {
    std::error_code ec;
    return fs::is_regular_file(state_path(), ec);
}

std::string Workspace::measure_state(StateMeasure* out) const {
    std::string raw = "{}";
    if (has_state()) {
        std::string err = read_file(state_path(), &raw);
        if (!err.empty()) return err;
    }
    auto canon = json_mini::canonicalize(raw);
    if (!canon) return "state is not valid JSON";
    if (out) {
        out->canonical = *canon;
        // json-c clamps out-of-range integers, so the re-serialized text can be
        // shorter than what was written.
        out->size = (int64_t)std::max(raw.size(), canon->size());
        out->digest = state_digest(*canon);
    }
    return "";
}

std::string Workspace::write_state(const std::string& json) const {
    return write_atomic(state_path(), json);
}

std::string Workspace::read_lineage(std::vector<std::string>* lines) const {
    if (lines) lines->clear();
    std::error_code ec;
    if (!fs::exists(lineage_path(), ec)) return "";
    std::ifstream f(lineage_path(), std::ios::binary);
    if (!f) return "cannot open lineage";
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (lines) lines->push_back(line);
    }
    if (f.bad()) return "lineage read failed";
    return "";
}

std::string Workspace::write_lineage(const std::vector<std::string>& lines) const {
    std::ostringstream oss;
    for (const auto& l : lines) oss << l << "\n";
    return write_atomic(lineage_path(), oss.str());
}

std::string Workspace::copy_from(const Workspace& src) const {
    return copy_truncated_from(src, SIZE_MAX);
}

std::string Workspace::copy_truncated_from(const Workspace& src, size_t keep_last) const {
    std::string err = init();
    if (!err.empty()) return err;

    std::error_code ec;
    if (src.has_state()) {
        fs::copy_file(src.state_path(), state_path(), fs::copy_options::overwrite_existing, ec);
        if (ec) return "copy state: " + ec.message();
    } else {
        fs::remove(state_path(), ec);
    }

    std::vector<std::string> lines;
    err = src.read_lineage(&lines);
    if (!err.empty()) return err;
    if (lines.size() > keep_last) {
        lines.erase(lines.begin(), lines.end() - (std::ptrdiff_t)keep_last);
    }
    return write_lineage(lines);
}

// ---------------- Arena ----------------

std::unique_ptr<Arena> Arena::create(const fs::path& base,
                                     const std::string& run_id,
                                     bool keep,
                                     std::string* err) {
    fs::path root = base / ("run_" + run_id);
    std::error_code ec;
    if (fs::exists(root, ec)) {
        if (err) *err = "arena already exists: " + root.string();
        return nullptr;
    }
    std::unique_ptr<Arena> a(new Arena(root, keep));
    for (const auto& d : {a->staging_dir(), a->sandboxes_dir(), a->workspaces_dir()}) {
        fs::create_directories(d, ec);
        if (ec) {
            if (err) *err = "arena mkdir: " + ec.message();
            return nullptr;
        }
    }
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);
    return a;
}

Arena::~Arena() {
    if (keep_) return;
    std::error_code ec;
    fs::remove_all(root_, ec);
}

Workspace Arena::new_workspace(const std::string& name, std::string* err) {
    seq_++;
    Workspace ws(workspaces_dir() / (std::to_string(seq_) + "_" + name));
    std::string e = ws.init();
    if (!e.empty() && err) *err = e;
    return ws;
}

} // namespace furnace
