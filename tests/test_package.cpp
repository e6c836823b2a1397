#include "test_common.h"
#include "furnace/package.h"
#include "furnace/proc.h"

#include <filesystem>

namespace fs = std::filesystem;
using namespace furnace;

static LoadResult load_variant(const fs::path& root, const std::string& name) {
    fs::path staging = root / (name + "_staging");
    fs::create_directories(staging);
    return load_package(root / name, staging);
}

static std::string detail_str(const LoadResult& r, const std::string& k) {
    auto it = r.detail.strs.find(k);
    return it == r.detail.strs.end() ? "" : it->second;
}

int main() {
    fs::path root = fresh_dir("furnace_test_package");

    // Test 1: static def scan
    {
        const std::string src =
            "\"\"\"doc\n"
            "def fake_in_docstring(a):\n"
            "\"\"\"\n"
            "def ingest(event, state):\n"
            "    return state, event\n"
            "class Helper:\n"
            "    def audit(self, a, b, c, d):\n"
            "        pass\n"
            "def compact(state,\n"
            "            lineage,\n"
            "            target_bytes=0, *rest):  # trailing comment\n"
            "    pass\n"
            "def audit(state, lineage=None, *, strict):\n"
            "    pass\n"
            "def opts(a, b=(1, 2), c='x,y'):\n"
            "    pass\n";
        auto defs = scan_top_level_defs(src);
        expect_eq_ll((long long)defs.size(), 4, "top-level defs only");
        expect_eq_str(defs[0].name, "ingest", "first def");
        expect_eq_ll(defs[0].required, 2, "ingest required");
        expect_eq_str(defs[1].name, "compact", "multi-line signature");
        expect_eq_ll(defs[1].required, 2, "compact required");
        expect_eq_ll(defs[1].total, 3, "compact total");
        expect_true(defs[1].varargs, "compact *rest");
        expect_eq_ll(defs[2].kwonly_required, 1, "keyword-only without default");
        expect_eq_ll(defs[3].total, 3, "defaults with commas inside brackets and quotes");
        expect_eq_ll(defs[3].required, 1, "opts required");

        expect_true(accepts_arity(defs[0], 2), "ingest takes 2");
        expect_true(!accepts_arity(defs[0], 3), "ingest refuses 3");
        expect_true(accepts_arity(defs[1], 3) && accepts_arity(defs[1], 7), "varargs absorbs extras");
        expect_true(!accepts_arity(defs[2], 2), "required keyword-only cannot be called positionally");
    }

    // Test 2: location syntax
    {
        std::string fn;
        expect_true(parse_location("ingest", &fn).empty() && fn == "ingest", "bare name");
        expect_true(parse_location("mutation.compact", &fn).empty() && fn == "compact", "module.func");
        expect_true(parse_location("mutation.py:audit", &fn).empty() && fn == "audit", "file:func");
        expect_true(!parse_location("other.ingest", &fn).empty(), "other module rejected");
        expect_true(!parse_location("os.py:system", &fn).empty(), "other file rejected");
        expect_true(!parse_location("mutation.1bad", &fn).empty(), "bad identifier rejected");
    }

    // Test 3: valid directory package
    {
        copy_fixture("kv_counter", root / "good");
        auto r = load_variant(root, "good");
        expect_true(r.ok, "fixture should load: " + r.internal);
        expect_eq_str(r.pkg.name, "kv_counter", "manifest name");
        expect_true(r.pkg.artifact_id.rfind("sha256:", 0) == 0 && r.pkg.artifact_id.size() == 71, "artifact id");
        expect_true(r.pkg.schema_digest.rfind("sha256:", 0) == 0, "schema digest");
        expect_eq_str(r.pkg.contract.ingest.function, "ingest", "ingest bound");
        expect_eq_str(r.pkg.contract.compact.function, "compact", "compact bound");
        expect_eq_str(r.pkg.contract.audit.function, "audit", "audit bound");
        for (const auto& f : required_package_files()) {
            expect_true(fs::exists(r.pkg.root / f), "staged copy has " + f);
        }

        // same content -> same id
        copy_fixture("kv_counter", root / "good2");
        auto r2 = load_variant(root, "good2");
        expect_eq_str(r2.pkg.artifact_id, r.pkg.artifact_id, "directory id depends on content only");
    }

    // Test 4: single wrapping directory is the root
    {
        copy_fixture("kv_counter", root / "wrapped" / "inner");
        auto r = load_variant(root, "wrapped");
        expect_true(r.ok, "wrapped package should load: " + r.internal);
    }

    // Test 5: layout failures
    {
        copy_fixture("kv_counter", root / "no_selftest");
        fs::remove(root / "no_selftest" / "SELFTEST.py");
        auto r = load_variant(root, "no_selftest");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "missing selftest is FORMAT_INVALID");
        expect_eq_str(detail_str(r, "file"), "SELFTEST.py", "missing file named");

        copy_fixture("kv_counter", root / "extra");
        write_text(root / "extra" / "payload.so", "x");
        r = load_variant(root, "extra");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "extra file is FORMAT_INVALID");
        expect_eq_ll(r.detail.ints["count"], 1, "extra count");

        copy_fixture("kv_counter", root / "subdir");
        write_text(root / "subdir" / "lib" / "x.py", "");
        r = load_variant(root, "subdir");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "subdirectory is FORMAT_INVALID");

        write_text(root / "notes.txt", "hello");
        r = load_variant(root, "notes.txt");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "plain file is FORMAT_INVALID");
        r = load_variant(root, "does_not_exist");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "missing input is FORMAT_INVALID");
    }

    // Test 6: manifest failures
    {
        struct Case {
            const char* name;
            const char* manifest;
            const char* error;
        };
        const Case cases[] = {
            {"m_json", "{not json", "manifest_not_json"},
            {"m_iface", "{\"name\":\"x\"}", "interface_missing"},
            {"m_op", "{\"interface\":{\"ingest\":\"ingest\",\"compact\":\"compact\"}}", "operation_missing"},
            {"m_type", "{\"interface\":{\"ingest\":1,\"compact\":\"compact\",\"audit\":\"audit\"}}",
             "location_not_string"},
            {"m_module", "{\"interface\":{\"ingest\":\"os.system\",\"compact\":\"compact\",\"audit\":\"audit\"}}",
             "location_invalid"},
            {"m_unbound", "{\"interface\":{\"ingest\":\"ingest\",\"compact\":\"shrink\",\"audit\":\"audit\"}}",
             "unresolved"},
            {"m_arity", "{\"interface\":{\"ingest\":\"ingest\",\"compact\":\"compact\",\"audit\":\"_size\"}}",
             "arity_mismatch"},
        };
        for (const auto& c : cases) {
            copy_fixture("kv_counter", root / c.name);
            write_text(root / c.name / "manifest.json", c.manifest);
            auto r = load_variant(root, c.name);
            expect_true(!r.ok && r.reason == ReasonCode::MANIFEST_INVALID, std::string(c.name) + " is MANIFEST_INVALID");
            expect_eq_str(detail_str(r, "error"), c.error, std::string(c.name) + " error class");
        }
    }

    // Test 7: zip archives (needs unzip and a python3 to build the archives)
    std::string py = resolve_executable("python3");
    if (!resolve_executable("unzip").empty() && !py.empty()) {
        ProcLimits lim;
        lim.timeout_ms = 20000;
        lim.rlimit_cpu_sec = 20;
        lim.rlimit_as_mb = 0;
        const std::string build =
            "import sys, zipfile, os\n"
            "src, dst, evil = sys.argv[1], sys.argv[2], sys.argv[3] == '1'\n"
            "with zipfile.ZipFile(dst, 'w') as z:\n"
            "    for n in sorted(os.listdir(src)):\n"
            "        z.write(os.path.join(src, n), 'kv_counter/' + n)\n"
            "    if evil:\n"
            "        z.writestr('../escape.txt', 'x')\n";
        ProcResult pr;
        bool ok = proc_run_capture_sandboxed({py, "-c", build, fixture_path("kv_counter").string(),
                                              (root / "pkg.zip").string(), "0"}, "", lim, &pr);
        expect_true(ok && pr.exit_code == 0, "build zip: " + pr.output);
        auto r = load_variant(root, "pkg.zip");
        expect_true(r.ok, "zip package should load: " + r.internal);
        expect_eq_str(r.pkg.name, "kv_counter", "zip manifest name");
        auto id = r.pkg.artifact_id;

        ok = proc_run_capture_sandboxed({py, "-c", build, fixture_path("kv_counter").string(),
                                         (root / "evil.zip").string(), "1"}, "", lim, &pr);
        expect_true(ok && pr.exit_code == 0, "build evil zip: " + pr.output);
        r = load_variant(root, "evil.zip");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "path traversal rejected");
        expect_eq_str(detail_str(r, "error"), "unsafe_archive_path", "traversal error class");
        expect_true(!fs::exists(root / "escape.txt"), "nothing extracted outside staging");
        expect_true(!r.pkg.artifact_id.empty() && r.pkg.artifact_id != id, "zip id is the archive hash");

        write_text(root / "garbage.zip", "not a zip at all");
        r = load_variant(root, "garbage.zip");
        expect_true(!r.ok && r.reason == ReasonCode::FORMAT_INVALID, "corrupt zip is FORMAT_INVALID");
    } else {
        std::cerr << "test_package: unzip/python3 unavailable, zip cases skipped" << std::endl;
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_package: ALL PASSED" << std::endl;
    return 0;
}
