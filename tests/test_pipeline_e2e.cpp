#include "test_common.h"

#include "furnace/outcome_log.h"
#include "furnace/pipeline.h"
#include "furnace/proc.h"

#include <vector>

using namespace furnace;

// End-to-end runs through real sandboxes. Needs python3 on PATH.

static HarnessConfig e2e_config(const std::filesystem::path& home) {
    HarnessConfig cfg;
    cfg.home = home;
    cfg.runtime = "python3";
    cfg.sandbox_timeout_ms = 60000;
    cfg.sandbox_cpu_sec = 60;
    cfg.sandbox_mem_mb = 1024;
    cfg.workspace_limit_bytes = 16LL * 1024 * 1024;
    return cfg;
}

static Schedules e2e_schedules() {
    Schedules s;
    s.baseline_events = 40;
    s.degradation_levels = {40, 10, 1};
    s.compaction_budgets = {1000, 300};
    s.restart_cycles = 2;
    s.restart_probe_events = 5;
    return s;
}

static PipelineResult run_once(const HarnessConfig& cfg, const std::filesystem::path& artifact) {
    Furnace f(cfg);
    f.set_schedules(e2e_schedules());
    return f.execute(artifact);
}

// Copy kv_counter, append extra functions to mutation.py and bind the
// contract to them. SELFTEST is reduced to a no-op so T0 passes.
static std::filesystem::path variant(const std::filesystem::path& dst, const std::string& extra,
                                     const std::string& ingest, const std::string& compact,
                                     const std::string& audit) {
    std::filesystem::path pkg = copy_fixture("kv_counter", dst);
    write_text(pkg / "mutation.py", read_text(pkg / "mutation.py") + "\n\n" + extra);
    write_text(pkg / "manifest.json",
               "{\"name\":\"" + dst.filename().string() + "\",\"interface\":{\"ingest\":\"" + ingest +
               "\",\"compact\":\"" + compact + "\",\"audit\":\"" + audit + "\"}}");
    write_text(pkg / "SELFTEST.py", "print('ok')\n");
    return pkg;
}

static std::string stage_of(const Verdict& v) {
    auto it = v.detail.strs.find("stage");
    return it == v.detail.strs.end() ? "" : it->second;
}

int main() {
    namespace fs = std::filesystem;
    if (resolve_executable("python3").empty()) {
        std::cerr << "test_pipeline_e2e: python3 not found, skipped" << std::endl;
        return 0;
    }

    fs::path root = fresh_dir("furnace_test_pipeline_e2e");
    fs::path home = root / "home";
    HarnessConfig cfg = e2e_config(home);
    int runs = 0;

    // Test 1: a well-formed artifact survives every tier
    {
        fs::path pkg = copy_fixture("kv_counter", root / "kv_counter");
        std::vector<std::string> lines;
        Furnace f(cfg);
        f.set_schedules(e2e_schedules());
        f.set_progress([&](const TierResult& r) { lines.push_back(render_tier_line(r)); });
        PipelineResult r = f.execute(pkg);
        runs++;

        expect_true(r.verdict.survivor, "kv_counter should survive: " + render_verdict_block(r.verdict));
        expect_eq_str(r.verdict.label(), "SURVIVOR_PHASE_0", "label");
        expect_eq_ll((long long)r.verdict.trail.size(), 5, "five tiers");
        expect_eq_ll((long long)lines.size(), 5, "progress lines");
        expect_true(lines[0].rfind("[T0 SELFTEST] PASS", 0) == 0, "first line: " + lines[0]);
        expect_true(r.error.empty(), "no persistence errors: " + r.error);
        expect_eq_ll(r.outcome_seq, 1, "first outcome entry");
        expect_true(r.sandboxes_created > 0, "sandboxes were used");
        expect_eq_ll(r.sandboxes_destroyed, r.sandboxes_created, "every sandbox torn down");
        expect_true(fs::exists(r.survivor_path / "mutation.py"), "survivor promoted");
        expect_true(fs::exists(r.outcome_record), "outcome record written");
        expect_true(fs::exists(r.run_log), "run log written");
        expect_eq_str(r.verdict.schedule_digest, schedule_digest(e2e_schedules()), "schedule digest recorded");

        // nothing left behind in the arena
        long long arena_entries = 0;
        std::error_code ec;
        for (const auto& e : fs::directory_iterator(home / "arena", ec)) {
            (void)e;
            arena_entries++;
        }
        expect_eq_ll(arena_entries, 0, "arena removed");
    }

    // Test 2: missing file is rejected at intake without a sandbox
    {
        fs::path pkg = copy_fixture("kv_counter", root / "no_selftest");
        fs::remove(pkg / "SELFTEST.py");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_INTAKE", "intake kill");
        expect_true(r.verdict.reason == ReasonCode::FORMAT_INVALID, "FORMAT_INVALID");
        expect_eq_ll(r.sandboxes_created, 0, "no sandbox for a rejected package");
        expect_eq_ll(r.verdict.exit_code(), 1, "kill exit code");
        expect_eq_ll(r.outcome_seq, 2, "second outcome entry");
    }

    // Test 3: failing self-test
    {
        fs::path pkg = copy_fixture("kv_counter", root / "bad_selftest");
        write_text(pkg / "SELFTEST.py", "raise SystemExit(3)\n");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T0", "T0 kill");
        expect_true(r.verdict.reason == ReasonCode::HARNESS_FAIL_T0, "HARNESS_FAIL_T0");
        expect_true(r.survivor_path.empty(), "kills are not promoted");
    }

    // Test 4: mutation.py that does not compile
    {
        fs::path pkg = copy_fixture("kv_counter", root / "bad_syntax");
        write_text(pkg / "mutation.py", read_text(pkg / "mutation.py") + "\nthis is not python\n");
        write_text(pkg / "SELFTEST.py", "print('ok')\n");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T1", "T1 kill");
        expect_true(r.verdict.reason == ReasonCode::HARNESS_FAIL_T1, "HARNESS_FAIL_T1");
        expect_eq_str(stage_of(r.verdict), "compile", "stage compile");
    }

    // Test 5: audit that raises on truncated history
    {
        fs::path pkg = copy_fixture("kv_counter", root / "fragile_audit");
        std::string src = read_text(pkg / "mutation.py");
        src += "\n\ndef strict_audit(state, lineage):\n"
               "    if len(lineage) != state.get(\"total_events\"):\n"
               "        raise RuntimeError(\"history gap\")\n"
               "    return audit(state, lineage)\n";
        write_text(pkg / "mutation.py", src);
        write_text(pkg / "manifest.json",
                   "{\"name\":\"fragile\",\"interface\":{\"ingest\":\"ingest\",\"compact\":\"compact\","
                   "\"audit\":\"strict_audit\"}}");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T2", "T2 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::HARNESS_FAIL_T2, "HARNESS_FAIL_T2");
        expect_eq_ll(r.verdict.detail.ints["truncation_level"], 10, "first truncated level");
        expect_eq_str(r.verdict.artifact_name, "fragile", "name from manifest");
    }

    // Test 6: compact that edits the lineage it was handed
    {
        fs::path pkg = variant(root / "forging_compact",
                               "def forging_compact(state, lineage, target_bytes):\n"
                               "    lineage.append({\"forged\": True})\n"
                               "    return compact(state, lineage, target_bytes)\n",
                               "ingest", "forging_compact", "audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T3", "T3 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::INVARIANT_FAIL, "lineage edit by compact is INVARIANT_FAIL");
        expect_eq_ll(r.verdict.detail.ints["budget"], 1000, "first budget");
    }

    // Test 7: audit that empties the lineage
    {
        fs::path pkg = variant(root / "clearing_audit",
                               "def clearing_audit(state, lineage):\n"
                               "    lineage.clear()\n"
                               "    return audit(state, lineage)\n",
                               "ingest", "compact", "clearing_audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T2", "T2 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::INVARIANT_FAIL, "lineage edit by audit is INVARIANT_FAIL");
        expect_eq_ll(r.verdict.detail.ints["truncation_level"], 40, "full history level");
    }

    // Test 8: audit answering something other than OK or ("HALT", reason)
    {
        fs::path pkg = variant(root / "vague_audit",
                               "def vague_audit(state, lineage):\n"
                               "    return 42\n",
                               "ingest", "compact", "vague_audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T2", "T2 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::HARNESS_FAIL_T2, "malformed audit is HARNESS_FAIL_T2");
        expect_eq_ll(r.verdict.detail.ints["truncation_level"], 40, "first level");
    }

    // Test 9: ingest returning the state alone instead of (state, item)
    {
        fs::path pkg = variant(root / "flat_ingest",
                               "def flat_ingest(event, state):\n"
                               "    return ingest(event, state)[0]\n",
                               "flat_ingest", "compact", "audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T2", "T2 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::HARNESS_FAIL_T2, "non-pair ingest is HARNESS_FAIL_T2");
        expect_eq_str(stage_of(r.verdict), "baseline", "stage baseline");
    }

    // Test 10: states that cannot be written as JSON
    {
        fs::path pkg = variant(root / "set_state",
                               "def set_ingest(event, state):\n"
                               "    s, item = ingest(event, state)\n"
                               "    s[\"seen\"] = {event.get(\"key\", \"\")}\n"
                               "    return s, item\n",
                               "set_ingest", "compact", "audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T2", "T2 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::INVARIANT_FAIL, "set in state is INVARIANT_FAIL");
        expect_eq_str(stage_of(r.verdict), "baseline", "stage baseline");
    }
    {
        fs::path pkg = variant(root / "surrogate_state",
                               "def surrogate_ingest(event, state):\n"
                               "    s, item = ingest(event, state)\n"
                               "    s[\"tag\"] = \"\\ud800\"\n"
                               "    return s, item\n",
                               "surrogate_ingest", "compact", "audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T2", "T2 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::INVARIANT_FAIL, "lone surrogate in state is INVARIANT_FAIL");
        expect_eq_str(stage_of(r.verdict), "baseline", "stage baseline");
    }
    {
        fs::path pkg = variant(root / "huge_int_compact",
                               "def huge_compact(state, lineage, target_bytes):\n"
                               "    return {\"blob\": 10 ** 3000}\n",
                               "ingest", "huge_compact", "audit");
        PipelineResult r = run_once(cfg, pkg);
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_T3", "T3 kill: " + render_verdict_block(r.verdict));
        expect_true(r.verdict.reason == ReasonCode::INVARIANT_FAIL, "integer past int64 is INVARIANT_FAIL");
        expect_eq_ll(r.verdict.detail.ints["budget"], 1000, "first budget");
    }

    // Test 11: missing runtime and pin mismatch stop before T0
    {
        HarnessConfig no_rt = cfg;
        no_rt.runtime = "furnace-no-such-runtime";
        PipelineResult r = run_once(no_rt, root / "kv_counter");
        runs++;
        expect_eq_str(r.verdict.label(), "KILLED_INTAKE", "missing runtime");
        expect_true(r.verdict.reason == ReasonCode::INTERNAL_ERROR, "INTERNAL_ERROR");
        expect_eq_str(stage_of(r.verdict), "runtime", "stage runtime");

        HarnessConfig pinned = cfg;
        pinned.runtime_pin = "2.1";
        r = run_once(pinned, root / "kv_counter");
        runs++;
        expect_eq_str(stage_of(r.verdict), "runtime_pin", "stage runtime_pin");
        expect_eq_ll(r.verdict.exit_code(), 1, "pin mismatch exit code");
    }

    // Test 12: an exception escaping the tier loop still ends in a logged verdict
    {
        fs::path pkg = copy_fixture("kv_counter", root / "throwing_progress");
        Furnace f(cfg);
        f.set_schedules(e2e_schedules());
        f.set_progress([](const TierResult&) { throw 7; });
        PipelineResult r = f.execute(pkg);
        runs++;
        expect_true(r.verdict.reason == ReasonCode::INTERNAL_ERROR, "INTERNAL_ERROR: " + render_verdict_block(r.verdict));
        expect_eq_str(stage_of(r.verdict), "pipeline", "stage pipeline");
        expect_true(!r.verdict.survivor && r.survivor_path.empty(), "not promoted");
        expect_true(r.outcome_seq > 0, "outcome entry written");
        expect_true(read_text(r.run_log).find("non-standard exception") != std::string::npos, "exception logged");
    }

    // exactly one entry per run, chain intact
    auto v = verify_outcome_log(cfg.outcome_log_path());
    expect_true(v.ok, "outcome log verifies: " + v.error);
    expect_eq_ll(v.entries, runs, "one outcome entry per run");

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_pipeline_e2e: ALL PASSED" << std::endl;
    return 0;
}
