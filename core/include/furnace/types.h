#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace furnace {

constexpr const char* kHarnessVersion = "furnace-0.4.1";

// Pipeline stages. INTAKE is the pre-tier loader stage.
enum class Tier : int {
    INTAKE = -1,
    T0 = 0, // SELFTEST
    T1 = 1, // SYNTAX/ISOLATION
    T2 = 2, // DEGRADATION
    T3 = 3, // COMPACTION
    T4 = 4, // RESTART
};

const char* tier_label(Tier t); // "T0".."T4", "INTAKE"
const char* tier_name(Tier t);  // "SELFTEST", "DEGRADATION", ...

// Canonical, public-safe reason taxonomy.
enum class ReasonCode {
    OK,
    FORMAT_INVALID,
    MANIFEST_INVALID,
    HARNESS_FAIL_T0,
    HARNESS_FAIL_T1,
    HARNESS_FAIL_T2,
    HARNESS_FAIL_T3,
    HARNESS_FAIL_T4,
    RESOURCE_EXHAUSTION,
    NONTERMINATION,
    DETERMINISM_FAIL,
    INVARIANT_FAIL,
    INTERNAL_ERROR,
};

const char* reason_to_str(ReasonCode r);
std::optional<ReasonCode> reason_from_str(const std::string& s);

// HARNESS_FAIL_T<n> for a tier; INTERNAL_ERROR for INTAKE.
ReasonCode harness_fail_for(Tier t);

// Outcome of one contract call or probe inside a sandbox.
enum class CallStatus {
    OK,
    RAISED,          // artifact code raised
    MALFORMED,       // wrong return shape / unresolved callable
    UNSERIALIZABLE,  // state or lineage item not JSON-serializable
    LINEAGE_MUTATED, // compact/audit changed the lineage it was given
    TIMEOUT,         // hard wall-clock timeout hit
    RESOURCE,        // rlimit / memory / workspace limit
    CRASHED,         // non-zero exit without a result
    CANCELLED,       // external cancellation
    HARNESS_ERROR,   // not attributable to the artifact
};

const char* callstatus_to_str(CallStatus s);

// Map a failed call to the canonical reason for the tier it happened in.
ReasonCode classify_call(CallStatus s, Tier t);

enum class AuditVerdict { NONE, OK, HALT };

const char* audit_verdict_str(AuditVerdict v);

// Public-safe key/value detail carried by tier results and verdicts
// (truncation_level, budget, size, cycle, stage, ...). Never paths, output
// or stack traces.
struct Detail {
    std::map<std::string, int64_t> ints;
    std::map<std::string, std::string> strs;

    void set(const std::string& k, int64_t v) { strs.erase(k); ints[k] = v; }
    void set(const std::string& k, const std::string& v) { ints.erase(k); strs[k] = v; }
    bool empty() const { return ints.empty() && strs.empty(); }

    // JSON object with sorted keys.
    std::string to_json() const;
};

struct RunHeader {
    std::string harness_version{kHarnessVersion};
    std::string run_id;      // uuid-like
    std::string artifact_id; // "sha256:<hex>" once known
};

} // namespace furnace
