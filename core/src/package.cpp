#include "furnace/package.h"
#include "furnace/fsutil.h"
#include "furnace/hash.h"
#include "furnace/json_mini.h"
#include "furnace/proc.h"
#include "furnace/sandbox.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace furnace {

namespace {

constexpr int64_t kMaxPackageBytes = 64LL * 1024 * 1024;

const char* kOps[3] = {"ingest", "compact", "audit"};

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!(std::isalpha((unsigned char)s[0]) || s[0] == '_')) return false;
    for (char c : s) {
        if (!(std::isalnum((unsigned char)c) || c == '_')) return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool hidden_entry(const std::string& name) {
    return name.empty() || name[0] == '.' || name == "__MACOSX";
}

// Advance the triple-quoted-string state across one source line.
void track_triple_quotes(const std::string& line, bool* in_triple, std::string* delim) {
    size_t pos = 0;
    while (pos < line.size()) {
        if (!*in_triple) {
            size_t a = line.find("\"\"\"", pos);
            size_t b = line.find("'''", pos);
            size_t hit = std::min(a, b);
            if (hit == std::string::npos) return;
            size_t hash = line.find('#', pos);
            if (hash != std::string::npos && hash < hit) return; // rest is a comment
            *in_triple = true;
            *delim = (hit == a) ? "\"\"\"" : "'''";
            pos = hit + 3;
        } else {
            size_t end = line.find(*delim, pos);
            if (end == std::string::npos) return;
            *in_triple = false;
            pos = end + 3;
        }
    }
}

// Split a parameter list on top-level commas (brackets and quotes respected).
std::vector<std::string> split_params(const std::string& params) {
    std::vector<std::string> out;
    std::string cur;
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < params.size(); i++) {
        char c = params[i];
        if (quote) {
            cur.push_back(c);
            if (c == '\\' && i + 1 < params.size()) {
                cur.push_back(params[++i]);
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') { quote = c; cur.push_back(c); continue; }
        if (c == '(' || c == '[' || c == '{') depth++;
        if (c == ')' || c == ']' || c == '}') depth--;
        if (c == ',' && depth == 0) {
            out.push_back(trim(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    std::string last = trim(cur);
    if (!last.empty()) out.push_back(last);
    return out;
}

PyDef parse_signature(const std::string& name, const std::string& params) {
    PyDef d;
    d.name = name;
    bool kwonly = false;
    for (const auto& raw : split_params(params)) {
        std::string p = trim(raw);
        if (p.empty() || p == "/") continue;
        if (p.rfind("**", 0) == 0) continue;
        if (p == "*") { kwonly = true; continue; }
        if (p[0] == '*') { d.varargs = true; kwonly = true; continue; }
        bool has_default = p.find('=') != std::string::npos;
        if (kwonly) {
            if (!has_default) d.kwonly_required++;
        } else {
            d.total++;
            if (!has_default) d.required++;
        }
    }
    return d;
}

LoadResult fail(LoadResult r, ReasonCode reason, const std::string& stage,
                const std::string& error, const std::string& internal) {
    r.ok = false;
    r.reason = reason;
    r.detail.set("stage", stage);
    r.detail.set("error", error);
    r.internal = internal;
    return r;
}

// sha256 over sorted name\0size\0content of the regular files at root.
std::string directory_id(const fs::path& root, std::string* err) {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(root, ec)) {
        std::error_code sec;
        auto st = fs::symlink_status(e.path(), sec);
        if (sec || !fs::is_regular_file(st)) continue;
        std::string n = e.path().filename().string();
        if (hidden_entry(n)) continue;
        names.push_back(n);
    }
    if (ec) {
        *err = "list package dir: " + ec.message();
        return "";
    }
    std::sort(names.begin(), names.end());

    hash::Sha256 h;
    for (const auto& n : names) {
        std::string body;
        std::string rerr = read_file(root / n, &body);
        if (!rerr.empty()) {
            *err = rerr;
            return "";
        }
        h.update(n);
        h.update(std::string(1, '\0'));
        h.update(std::to_string(body.size()));
        h.update(std::string(1, '\0'));
        h.update(body);
    }
    return "sha256:" + h.finish_hex();
}

ProcLimits host_tool_limits() {
    ProcLimits lim;
    lim.timeout_ms = 30000;
    lim.output_max_bytes = 1024 * 1024;
    lim.rlimit_cpu_sec = 30;
    lim.rlimit_as_mb = 512;
    lim.rlimit_fsize_mb = 64;
    lim.rlimit_nofile = 64;
    return lim;
}

} // namespace

const std::vector<std::string>& required_package_files() {
    static const std::vector<std::string> files = {
        "manifest.json", "schema.json", "mutation.py", "SELFTEST.py", "README.md",
    };
    return files;
}

std::vector<PyDef> scan_top_level_defs(const std::string& source) {
    std::vector<PyDef> out;
    std::vector<std::string> lines;
    {
        std::istringstream iss(source);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
    }

    bool in_triple = false;
    std::string delim;
    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];
        if (in_triple || line.rfind("def ", 0) != 0) {
            track_triple_quotes(line, &in_triple, &delim);
            continue;
        }

        size_t p = 4;
        while (p < line.size() && (line[p] == ' ' || line[p] == '\t')) p++;
        size_t name_start = p;
        while (p < line.size() && (std::isalnum((unsigned char)line[p]) || line[p] == '_')) p++;
        std::string name = line.substr(name_start, p - name_start);
        while (p < line.size() && (line[p] == ' ' || line[p] == '\t')) p++;
        if (name.empty() || p >= line.size() || line[p] != '(') continue;

        // collect up to the matching ')', possibly across lines
        std::string params;
        int depth = 1;
        char quote = 0;
        size_t li = i;
        size_t ci = p + 1;
        bool closed = false;
        while (li < lines.size() && !closed) {
            const std::string& cur = lines[li];
            for (; ci < cur.size(); ci++) {
                char c = cur[ci];
                if (quote) {
                    if (c == '\\' && ci + 1 < cur.size()) { params.push_back(c); params.push_back(cur[++ci]); continue; }
                    if (c == quote) quote = 0;
                    params.push_back(c);
                    continue;
                }
                if (c == '\'' || c == '"') { quote = c; params.push_back(c); continue; }
                if (c == '#') break; // comment to end of line
                if (c == '(' || c == '[' || c == '{') depth++;
                if (c == ')' || c == ']' || c == '}') {
                    depth--;
                    if (depth == 0) { closed = true; break; }
                }
                params.push_back(c);
            }
            if (!closed) {
                params.push_back(' ');
                li++;
                ci = 0;
            }
        }
        if (!closed) break; // unterminated signature; syntax check will catch it
        out.push_back(parse_signature(name, params));
        i = li;
    }
    return out;
}

bool accepts_arity(const PyDef& d, int n) {
    if (d.kwonly_required > 0) return false;
    if (n < d.required) return false;
    return n <= d.total || d.varargs;
}

std::string parse_location(const std::string& loc_in, std::string* func) {
    std::string loc = trim(loc_in);
    if (loc.empty()) return "empty location";

    std::string module;
    std::string fn;
    size_t colon = loc.find(':');
    if (colon != std::string::npos) {
        module = trim(loc.substr(0, colon));
        fn = trim(loc.substr(colon + 1));
        if (module != "mutation.py" && module != "mutation") return "location names another module";
    } else {
        size_t dot = loc.rfind('.');
        if (dot != std::string::npos) {
            module = loc.substr(0, dot);
            fn = loc.substr(dot + 1);
            if (module != "mutation") return "location names another module";
        } else {
            fn = loc;
        }
    }
    if (!is_identifier(fn)) return "invalid function name";
    if (func) *func = fn;
    return "";
}

LoadResult load_package(const fs::path& input, const fs::path& staging_dir) {
    LoadResult r;
    r.pkg.name = input.filename().string();
    if (r.pkg.name.empty()) r.pkg.name = input.parent_path().filename().string();

    std::error_code ec;
    auto st = fs::status(input, ec);
    if (ec || !fs::exists(st)) {
        return fail(r, ReasonCode::FORMAT_INVALID, "intake", "not_found", "input does not exist");
    }

    fs::path base;
    if (fs::is_regular_file(st)) {
        std::string ext = input.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        if (ext != ".zip") {
            return fail(r, ReasonCode::FORMAT_INVALID, "intake", "unsupported_container",
                        "not a directory or .zip: " + input.string());
        }
        r.pkg.name = input.stem().string();

        auto id = hash::sha256_file_hex(input);
        if (!id) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "intake", "unreadable", "cannot read archive");
        }
        r.pkg.artifact_id = "sha256:" + *id;

        if (resolve_executable("unzip").empty()) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "archive", "extractor_unavailable",
                        "unzip not found on PATH");
        }

        ProcResult list;
        if (!proc_run_capture_sandboxed({"unzip", "-Z1", input.string()}, "", host_tool_limits(), &list)) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "archive", "extractor_failed", list.error);
        }
        if (list.timed_out || list.exit_code != 0) {
            return fail(r, ReasonCode::FORMAT_INVALID, "archive", "not_a_zip",
                        "unzip -Z1 exit=" + std::to_string(list.exit_code) + ": " + list.output.substr(0, 400));
        }
        if (list.output_truncated) {
            return fail(r, ReasonCode::FORMAT_INVALID, "archive", "archive_too_large", "listing truncated");
        }
        std::istringstream entries(list.output);
        std::string entry;
        while (std::getline(entries, entry)) {
            if (!entry.empty() && entry.back() == '\r') entry.pop_back();
            if (entry.empty()) continue;
            bool unsafe = entry[0] == '/' || entry.find('\\') != std::string::npos;
            for (const auto& comp : fs::path(entry)) {
                if (comp == "..") unsafe = true;
            }
            if (unsafe) {
                return fail(r, ReasonCode::FORMAT_INVALID, "archive", "unsafe_archive_path",
                            "rejected entry: " + entry);
            }
        }

        base = staging_dir / "extract";
        fs::create_directories(base, ec);
        if (ec) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "archive", "staging_failed", ec.message());
        }
        ProcResult ex;
        bool started = proc_run_capture_sandboxed({"unzip", "-qq", "-o", input.string(), "-d", base.string()},
                                                  "", host_tool_limits(), &ex);
        if (!started) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "archive", "extractor_failed", ex.error);
        }
        if (ex.timed_out || ex.exit_code != 0) {
            return fail(r, ReasonCode::FORMAT_INVALID, "archive", "extract_failed",
                        "unzip exit=" + std::to_string(ex.exit_code) + ": " + ex.output.substr(0, 400));
        }
        if (dir_size_bytes(base) > kMaxPackageBytes) {
            return fail(r, ReasonCode::FORMAT_INVALID, "archive", "archive_too_large", "extracted size over limit");
        }
    } else if (fs::is_directory(st)) {
        base = input;
    } else {
        return fail(r, ReasonCode::FORMAT_INVALID, "intake", "unsupported_container", "special file");
    }

    // single visible top-level directory is the package root
    fs::path root = base;
    {
        std::vector<fs::directory_entry> visible;
        for (const auto& e : fs::directory_iterator(base, ec)) {
            if (!hidden_entry(e.path().filename().string())) visible.push_back(e);
        }
        if (ec) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "layout", "unreadable", ec.message());
        }
        if (visible.size() == 1) {
            std::error_code sec;
            auto vst = fs::symlink_status(visible[0].path(), sec);
            if (!sec && fs::is_directory(vst)) root = visible[0].path();
        }
    }

    if (r.pkg.artifact_id.empty()) {
        std::string id_err;
        std::string id = directory_id(root, &id_err);
        if (!id_err.empty()) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "intake", "unreadable", id_err);
        }
        r.pkg.artifact_id = id;
    }

    // exactly the five files, nothing else
    std::set<std::string> present;
    int64_t extras = 0;
    bool has_subdir = false;
    for (const auto& e : fs::directory_iterator(root, ec)) {
        std::string n = e.path().filename().string();
        if (hidden_entry(n)) continue;
        std::error_code sec;
        auto est = fs::symlink_status(e.path(), sec);
        if (!sec && fs::is_directory(est)) {
            has_subdir = true;
            continue;
        }
        if (sec || !fs::is_regular_file(est)) {
            extras++;
            continue;
        }
        const auto& req = required_package_files();
        if (std::find(req.begin(), req.end(), n) != req.end()) {
            present.insert(n);
        } else {
            extras++;
        }
    }
    if (ec) {
        return fail(r, ReasonCode::INTERNAL_ERROR, "layout", "unreadable", ec.message());
    }
    for (const auto& f : required_package_files()) {
        if (!present.count(f)) {
            LoadResult out = fail(r, ReasonCode::FORMAT_INVALID, "layout", "missing_file", "missing " + f);
            out.detail.set("file", f);
            return out;
        }
    }
    if (has_subdir) {
        return fail(r, ReasonCode::FORMAT_INVALID, "layout", "unexpected_directory", "package has a subdirectory");
    }
    if (extras > 0) {
        LoadResult out = fail(r, ReasonCode::FORMAT_INVALID, "layout", "extra_entries",
                              std::to_string(extras) + " unexpected entries");
        out.detail.set("count", extras);
        return out;
    }

    // stage an immutable copy
    fs::path staged = staging_dir / "package";
    fs::create_directories(staged, ec);
    if (ec) {
        return fail(r, ReasonCode::INTERNAL_ERROR, "layout", "staging_failed", ec.message());
    }
    for (const auto& f : required_package_files()) {
        fs::copy_file(root / f, staged / f, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return fail(r, ReasonCode::INTERNAL_ERROR, "layout", "staging_failed", f + ": " + ec.message());
        }
    }
    r.pkg.root = staged;

    // manifest
    std::string manifest_raw;
    std::string rerr = read_file(staged / "manifest.json", &manifest_raw);
    if (!rerr.empty()) {
        return fail(r, ReasonCode::INTERNAL_ERROR, "manifest", "unreadable", rerr);
    }
    json_mini::Doc manifest = json_mini::parse(manifest_raw);
    if (!manifest) {
        return fail(r, ReasonCode::MANIFEST_INVALID, "manifest", "manifest_not_json", "manifest.json does not parse");
    }
    if (!json_object_is_type(manifest.root, json_type_object)) {
        return fail(r, ReasonCode::MANIFEST_INVALID, "manifest", "manifest_not_object", "manifest root is not an object");
    }
    json_object* iface = json_mini::get(manifest.root, "interface");
    if (!iface || !json_object_is_type(iface, json_type_object)) {
        return fail(r, ReasonCode::MANIFEST_INVALID, "manifest", "interface_missing", "no interface object");
    }

    if (auto nm = json_mini::get_string(manifest.root, "name")) {
        std::string clean;
        for (char c : *nm) {
            if (std::isprint((unsigned char)c)) clean.push_back(c);
            if (clean.size() >= 64) break;
        }
        if (!trim(clean).empty()) r.pkg.name = trim(clean);
    }

    std::map<std::string, std::string> bound;
    for (const char* op : kOps) {
        json_object* v = json_mini::get(iface, op);
        if (!v) {
            LoadResult out = fail(r, ReasonCode::MANIFEST_INVALID, "manifest", "operation_missing",
                                  std::string("interface lacks ") + op);
            out.detail.set("operation", std::string(op));
            return out;
        }
        if (!json_object_is_type(v, json_type_string)) {
            LoadResult out = fail(r, ReasonCode::MANIFEST_INVALID, "manifest", "location_not_string",
                                  std::string("interface.") + op + " is not a string");
            out.detail.set("operation", std::string(op));
            return out;
        }
        std::string fn;
        std::string perr = parse_location(json_object_get_string(v), &fn);
        if (!perr.empty()) {
            LoadResult out = fail(r, ReasonCode::MANIFEST_INVALID, "manifest", "location_invalid",
                                  std::string(op) + ": " + perr);
            out.detail.set("operation", std::string(op));
            return out;
        }
        bound[op] = fn;
    }

    // bind against mutation.py by name and arity
    std::string source;
    rerr = read_file(staged / "mutation.py", &source);
    if (!rerr.empty()) {
        return fail(r, ReasonCode::INTERNAL_ERROR, "binding", "unreadable", rerr);
    }
    std::map<std::string, PyDef> defs;
    for (auto& d : scan_top_level_defs(source)) defs[d.name] = d; // later defs win

    const int arity[3] = {kIngestArity, kCompactArity, kAuditArity};
    OperationBinding* slots[3] = {&r.pkg.contract.ingest, &r.pkg.contract.compact, &r.pkg.contract.audit};
    for (int i = 0; i < 3; i++) {
        const std::string op = kOps[i];
        auto it = defs.find(bound[op]);
        if (it == defs.end()) {
            LoadResult out = fail(r, ReasonCode::MANIFEST_INVALID, "binding", "unresolved",
                                  op + " -> " + bound[op] + " not a top-level def");
            out.detail.set("operation", op);
            return out;
        }
        if (!accepts_arity(it->second, arity[i])) {
            LoadResult out = fail(r, ReasonCode::MANIFEST_INVALID, "binding", "arity_mismatch",
                                  op + " -> " + bound[op] + " cannot take " + std::to_string(arity[i]) + " args");
            out.detail.set("operation", op);
            return out;
        }
        slots[i]->op = op;
        slots[i]->function = it->second.name;
    }

    auto schema = hash::sha256_file_hex(staged / "schema.json");
    if (schema) r.pkg.schema_digest = "sha256:" + *schema;

    r.ok = true;
    r.reason = ReasonCode::OK;
    return r;
}

} // namespace furnace
