#include "test_common.h"

#include "furnace/json_mini.h"
#include "furnace/verdict.h"

#include <vector>

using namespace furnace;

static std::vector<TierResult> passing_trail(int upto) {
    std::vector<TierResult> trail;
    for (int t = 0; t <= upto; t++) {
        TierResult r = TierResult::pass((Tier)t);
        r.elapsed_ms = 10 * (t + 1);
        trail.push_back(r);
    }
    return trail;
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_dir("furnace_test_verdict");

    RunHeader hdr;
    hdr.run_id = "run-1";
    hdr.artifact_id = "sha256:" + std::string(64, 'a');

    // Test 1: reason taxonomy and call classification
    {
        const ReasonCode all[] = {
            ReasonCode::OK, ReasonCode::FORMAT_INVALID, ReasonCode::MANIFEST_INVALID,
            ReasonCode::HARNESS_FAIL_T0, ReasonCode::HARNESS_FAIL_T1, ReasonCode::HARNESS_FAIL_T2,
            ReasonCode::HARNESS_FAIL_T3, ReasonCode::HARNESS_FAIL_T4, ReasonCode::RESOURCE_EXHAUSTION,
            ReasonCode::NONTERMINATION, ReasonCode::DETERMINISM_FAIL, ReasonCode::INVARIANT_FAIL,
            ReasonCode::INTERNAL_ERROR,
        };
        for (ReasonCode r : all) {
            auto back = reason_from_str(reason_to_str(r));
            expect_true(back && *back == r, std::string("reason name resolves: ") + reason_to_str(r));
        }
        expect_true(!reason_from_str("SEGFAULT"), "unknown reason rejected");

        expect_true(classify_call(CallStatus::RAISED, Tier::T3) == ReasonCode::HARNESS_FAIL_T3, "raise in T3");
        expect_true(classify_call(CallStatus::CRASHED, Tier::T0) == ReasonCode::HARNESS_FAIL_T0, "crash in T0");
        expect_true(classify_call(CallStatus::TIMEOUT, Tier::T4) == ReasonCode::NONTERMINATION, "timeout");
        expect_true(classify_call(CallStatus::RESOURCE, Tier::T2) == ReasonCode::RESOURCE_EXHAUSTION, "resource");
        expect_true(classify_call(CallStatus::LINEAGE_MUTATED, Tier::T3) == ReasonCode::INVARIANT_FAIL, "lineage");
        expect_true(classify_call(CallStatus::HARNESS_ERROR, Tier::T1) == ReasonCode::INTERNAL_ERROR, "harness");
        expect_true(harness_fail_for(Tier::INTAKE) == ReasonCode::INTERNAL_ERROR, "no harness fail for intake");
    }

    // Test 2: survivor
    Verdict survivor = build_verdict(hdr, "kv", passing_trail(4), "sha256:sched");
    {
        expect_true(survivor.survivor, "all five tiers passed");
        expect_eq_str(survivor.label(), "SURVIVOR_PHASE_0", "survivor label");
        expect_eq_ll(survivor.exit_code(), 0, "survivor exit code");
        expect_true(survivor.reason == ReasonCode::OK, "survivor reason");

        json_mini::Doc d = json_mini::parse(survivor.to_json());
        expect_true((bool)d, "verdict json parses");
        expect_eq_str(json_mini::get_string(d.root, "verdict").value_or(""), "SURVIVOR_PHASE_0", "json verdict");
        expect_eq_str(json_mini::get_string(d.root, "schedule_digest").value_or(""), "sha256:sched", "json schedule");
        expect_eq_ll(json_mini::get_int(d.root, "exit_code").value_or(-1), 0, "json exit code");
        json_object* timings = json_mini::get(d.root, "timings_ms");
        expect_eq_ll(json_mini::get_int(timings, "T4").value_or(-1), 50, "T4 timing");
        expect_eq_str(survivor.to_json(), survivor.to_json(), "stable serialization");
    }

    // Test 3: kill at T2 keeps the failing tier's detail
    Verdict killed;
    {
        auto trail = passing_trail(1);
        Detail det;
        det.set("truncation_level", (int64_t)50);
        trail.push_back(TierResult::fail(Tier::T2, ReasonCode::HARNESS_FAIL_T2, det));
        killed = build_verdict(hdr, "kv", trail, "sha256:sched");
        expect_true(!killed.survivor, "killed");
        expect_eq_str(killed.label(), "KILLED_T2", "killed label");
        expect_eq_ll(killed.exit_code(), 1, "kill exit code");
        expect_eq_ll(killed.detail.ints["truncation_level"], 50, "detail carried");

        std::string block = render_verdict_block(killed);
        expect_true(block.find("VERDICT: KILLED_T2:HARNESS_FAIL_T2") != std::string::npos, "block headline");
        expect_true(block.find("truncation_level") != std::string::npos, "block detail");
        expect_true(block.find("exit_code: 1") != std::string::npos, "block exit code");

        expect_eq_str(render_tier_line(trail[0]), "[T0 SELFTEST] PASS (10 ms)", "pass line");
        std::string fail_line = render_tier_line(trail.back());
        expect_true(fail_line.rfind("[T2 DEGRADATION] FAIL", 0) == 0, "fail line prefix: " + fail_line);
        expect_true(fail_line.find("HARNESS_FAIL_T2") != std::string::npos, "fail line reason");
    }

    // Test 4: degenerate trails and intake
    {
        Verdict v = build_verdict(hdr, "kv", {}, "sha256:sched");
        expect_true(!v.survivor && v.tier == Tier::INTAKE && v.reason == ReasonCode::INTERNAL_ERROR, "empty trail");

        v = build_verdict(hdr, "kv", passing_trail(2), "sha256:sched");
        expect_true(!v.survivor && v.reason == ReasonCode::INTERNAL_ERROR, "incomplete trail is not a survivor");

        Detail d;
        d.set("stage", std::string("layout"));
        v = intake_verdict(hdr, "kv", ReasonCode::FORMAT_INVALID, d, "sha256:sched");
        expect_eq_str(v.label(), "KILLED_INTAKE", "intake label");
        expect_eq_ll(v.exit_code(), 1, "intake exit code");
    }

    // Test 5: outcome record
    {
        expect_eq_str(artifact_hex(hdr.artifact_id), std::string(64, 'a'), "hex of id");
        expect_eq_str(artifact_hex("sha256:XYZ"), "", "non-hex id");
        expect_eq_str(artifact_hex("md5:abc"), "", "wrong scheme");

        fs::path written;
        std::string err = write_outcome_record(killed, dir / "results", &written);
        expect_true(err.empty(), "write record: " + err);
        expect_true(written == dir / "results" / std::string(64, 'a') / "outcome.json", "record path");

        json_mini::Doc d = json_mini::parse(read_text(written));
        expect_eq_str(json_mini::get_string(d.root, "schema_version").value_or(""), "FURNACE_OUTCOME_V1", "schema");
        expect_eq_str(json_mini::get_string(d.root, "stage").value_or(""), "T2", "stage");
        expect_eq_str(json_mini::get_string(d.root, "result").value_or(""), "KILLED_T2", "result");
        auto classes = json_mini::get_array_strings(d.root, "classes");
        expect_true(classes.size() == 1 && classes[0] == "HARNESS_FAIL_T2", "classes");

        Verdict anon = killed;
        anon.artifact_id.clear();
        expect_true(!write_outcome_record(anon, dir / "results").empty(), "no id, no record");
    }

    // Test 6: survivor promotion
    {
        fs::path pkg = dir / "pkg";
        write_text(pkg / "mutation.py", "v1");
        write_text(pkg / "README.md", "readme");

        expect_true(!promote_survivor(killed, pkg, dir / "survivors").empty(), "kills are never promoted");

        fs::path out;
        std::string err = promote_survivor(survivor, pkg, dir / "survivors", &out);
        expect_true(err.empty(), "promote: " + err);
        expect_eq_str(read_text(out / "mutation.py"), "v1", "copied content");

        write_text(pkg / "mutation.py", "v2");
        fs::remove(pkg / "README.md");
        err = promote_survivor(survivor, pkg, dir / "survivors", &out);
        expect_true(err.empty(), "re-promote: " + err);
        expect_eq_str(read_text(out / "mutation.py"), "v2", "replaced content");
        expect_true(!fs::exists(out / "README.md"), "earlier copy fully replaced");

        long long entries = 0;
        for (const auto& e : fs::directory_iterator(dir / "survivors")) {
            (void)e;
            entries++;
        }
        expect_eq_ll(entries, 1, "no staging leftovers");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_verdict: ALL PASSED" << std::endl;
    return 0;
}
