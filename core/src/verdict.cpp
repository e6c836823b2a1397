#include "furnace/verdict.h"
#include "furnace/fsutil.h"
#include "furnace/json_mini.h"

#include <json-c/json.h>

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace furnace {

namespace {

json_object* detail_object(const Detail& d) {
    json_mini::Doc doc = json_mini::parse(d.to_json());
    return doc ? doc.release() : json_object_new_object();
}

bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

} // namespace

std::string Verdict::label() const {
    if (survivor) return kSurvivorLabel;
    return std::string("KILLED_") + tier_label(tier);
}

std::string Verdict::to_json() const {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "run_id", json_mini::new_string(run_id));
    json_object_object_add(o, "artifact_id", json_mini::new_string(artifact_id));
    json_object_object_add(o, "artifact_name", json_mini::new_string(artifact_name));
    json_object_object_add(o, "verdict", json_mini::new_string(label()));
    json_object_object_add(o, "tier", json_mini::new_string(tier_label(tier)));
    json_object_object_add(o, "reason", json_mini::new_string(reason_to_str(reason)));
    json_object_object_add(o, "detail", detail_object(detail));

    json_object* timings = json_object_new_object();
    for (const auto& t : trail) {
        json_object_object_add(timings, tier_label(t.tier), json_object_new_int64(t.elapsed_ms));
    }
    json_object_object_add(o, "timings_ms", timings);

    json_object_object_add(o, "schedule_digest", json_mini::new_string(schedule_digest));
    json_object_object_add(o, "harness_version", json_mini::new_string(harness_version));
    json_object_object_add(o, "exit_code", json_object_new_int(exit_code()));

    std::string out = json_mini::canonical(o);
    json_object_put(o);
    return out;
}

Verdict build_verdict(const RunHeader& hdr,
                      const std::string& artifact_name,
                      const std::vector<TierResult>& trail,
                      const std::string& schedule_digest) {
    Verdict v;
    v.run_id = hdr.run_id;
    v.artifact_id = hdr.artifact_id;
    v.artifact_name = artifact_name;
    v.harness_version = hdr.harness_version;
    v.schedule_digest = schedule_digest;
    v.trail = trail;

    if (trail.empty()) {
        v.tier = Tier::INTAKE;
        v.reason = ReasonCode::INTERNAL_ERROR;
        v.detail.set("stage", std::string("no_tiers"));
        return v;
    }
    const TierResult& last = trail.back();
    v.tier = last.tier;
    if (last.passed && last.tier == Tier::T4) {
        v.survivor = true;
        v.reason = ReasonCode::OK;
        return v;
    }
    v.reason = last.passed ? ReasonCode::INTERNAL_ERROR : last.reason;
    v.detail = last.detail;
    if (last.passed) v.detail.set("stage", std::string("incomplete"));
    return v;
}

Verdict intake_verdict(const RunHeader& hdr,
                       const std::string& artifact_name,
                       ReasonCode reason,
                       const Detail& detail,
                       const std::string& schedule_digest) {
    Verdict v;
    v.run_id = hdr.run_id;
    v.artifact_id = hdr.artifact_id;
    v.artifact_name = artifact_name;
    v.harness_version = hdr.harness_version;
    v.schedule_digest = schedule_digest;
    v.tier = Tier::INTAKE;
    v.reason = reason;
    v.detail = detail;
    return v;
}

std::string render_tier_line(const TierResult& r) {
    std::ostringstream oss;
    oss << "[" << tier_label(r.tier) << " " << tier_name(r.tier) << "] " << (r.passed ? "PASS" : "FAIL") << " ("
        << r.elapsed_ms << " ms)";
    if (!r.passed) oss << " " << reason_to_str(r.reason);
    return oss.str();
}

std::string render_verdict_block(const Verdict& v) {
    const std::string bar(60, '=');
    std::ostringstream oss;
    oss << bar << "\n";
    if (v.survivor) {
        oss << "VERDICT: " << v.label() << "\n";
    } else {
        oss << "VERDICT: " << v.label() << ":" << reason_to_str(v.reason) << "\n";
    }
    oss << "artifact: " << v.artifact_name;
    if (!v.artifact_id.empty()) oss << " (" << v.artifact_id << ")";
    oss << "\n";
    oss << "run_id: " << v.run_id << "\n";
    if (!v.detail.empty()) oss << "detail: " << v.detail.to_json() << "\n";
    int64_t total = 0;
    for (const auto& t : v.trail) total += t.elapsed_ms;
    oss << "elapsed: " << total << " ms\n";
    oss << "schedule: " << v.schedule_digest << "\n";
    oss << "exit_code: " << v.exit_code() << "\n";
    oss << bar << "\n";
    return oss.str();
}

std::string artifact_hex(const std::string& artifact_id) {
    const std::string prefix = "sha256:";
    if (artifact_id.compare(0, prefix.size(), prefix) != 0) return "";
    std::string hex = artifact_id.substr(prefix.size());
    return is_hex(hex) ? hex : "";
}

std::string outcome_record_json(const Verdict& v) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "schema_version", json_mini::new_string(kOutcomeSchemaVersion));
    json_object_object_add(o, "artifact_id", json_mini::new_string(v.artifact_id));
    json_object_object_add(o, "run_id", json_mini::new_string(v.run_id));
    json_object_object_add(o, "stage", json_mini::new_string(tier_label(v.tier)));
    json_object_object_add(o, "result", json_mini::new_string(v.label()));
    json_object* classes = json_object_new_array();
    json_object_array_add(classes, json_mini::new_string(reason_to_str(v.reason)));
    json_object_object_add(o, "classes", classes);
    json_object_object_add(o, "details", detail_object(v.detail));
    json_object_object_add(o, "schedule_digest", json_mini::new_string(v.schedule_digest));
    json_object_object_add(o, "harness_version", json_mini::new_string(v.harness_version));

    std::string out = json_mini::canonical(o);
    json_object_put(o);
    return out;
}

std::string write_outcome_record(const Verdict& v, const fs::path& results_dir, fs::path* written) {
    std::string hex = artifact_hex(v.artifact_id);
    if (hex.empty()) return "artifact id unavailable";
    fs::path dst = results_dir / hex / "outcome.json";
    std::string err = write_atomic(dst, outcome_record_json(v) + "\n");
    if (!err.empty()) return err;
    if (written) *written = dst;
    return "";
}

std::string promote_survivor(const Verdict& v,
                             const fs::path& package_root,
                             const fs::path& survivors_dir,
                             fs::path* promoted) {
    if (!v.survivor) return "not a survivor";
    std::string hex = artifact_hex(v.artifact_id);
    if (hex.empty()) return "artifact id unavailable";

    std::error_code ec;
    fs::create_directories(survivors_dir, ec);
    if (ec) return "survivors mkdir: " + ec.message();

    // stage next to the destination, then swap in with a rename
    fs::path dst = survivors_dir / hex;
    fs::path tmp = survivors_dir / ("." + hex + ".tmp." + v.run_id);
    fs::remove_all(tmp, ec);
    std::string err = copy_tree(package_root, tmp);
    if (!err.empty()) {
        fs::remove_all(tmp, ec);
        return err;
    }
    fs::remove_all(dst, ec);
    fs::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove_all(tmp, ec2);
        return "survivor rename: " + ec.message();
    }
    if (promoted) *promoted = dst;
    return "";
}

} // namespace furnace
