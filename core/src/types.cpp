#include "furnace/types.h"
#include "furnace/json_mini.h"

#include <sstream>

namespace furnace {

const char* tier_label(Tier t) {
    switch (t) {
        case Tier::INTAKE: return "INTAKE";
        case Tier::T0: return "T0";
        case Tier::T1: return "T1";
        case Tier::T2: return "T2";
        case Tier::T3: return "T3";
        case Tier::T4: return "T4";
    }
    return "INTAKE";
}

const char* tier_name(Tier t) {
    switch (t) {
        case Tier::INTAKE: return "INTAKE";
        case Tier::T0: return "SELFTEST";
        case Tier::T1: return "SYNTAX";
        case Tier::T2: return "DEGRADATION";
        case Tier::T3: return "COMPACTION";
        case Tier::T4: return "RESTART";
    }
    return "INTAKE";
}

const char* reason_to_str(ReasonCode r) {
    switch (r) {
        case ReasonCode::OK: return "OK";
        case ReasonCode::FORMAT_INVALID: return "FORMAT_INVALID";
        case ReasonCode::MANIFEST_INVALID: return "MANIFEST_INVALID";
        case ReasonCode::HARNESS_FAIL_T0: return "HARNESS_FAIL_T0";
        case ReasonCode::HARNESS_FAIL_T1: return "HARNESS_FAIL_T1";
        case ReasonCode::HARNESS_FAIL_T2: return "HARNESS_FAIL_T2";
        case ReasonCode::HARNESS_FAIL_T3: return "HARNESS_FAIL_T3";
        case ReasonCode::HARNESS_FAIL_T4: return "HARNESS_FAIL_T4";
        case ReasonCode::RESOURCE_EXHAUSTION: return "RESOURCE_EXHAUSTION";
        case ReasonCode::NONTERMINATION: return "NONTERMINATION";
        case ReasonCode::DETERMINISM_FAIL: return "DETERMINISM_FAIL";
        case ReasonCode::INVARIANT_FAIL: return "INVARIANT_FAIL";
        case ReasonCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

std::optional<ReasonCode> reason_from_str(const std::string& s) {
    static const ReasonCode all[] = {
        ReasonCode::OK, ReasonCode::FORMAT_INVALID, ReasonCode::MANIFEST_INVALID,
        ReasonCode::HARNESS_FAIL_T0, ReasonCode::HARNESS_FAIL_T1, ReasonCode::HARNESS_FAIL_T2,
        ReasonCode::HARNESS_FAIL_T3, ReasonCode::HARNESS_FAIL_T4, ReasonCode::RESOURCE_EXHAUSTION,
        ReasonCode::NONTERMINATION, ReasonCode::DETERMINISM_FAIL, ReasonCode::INVARIANT_FAIL,
        ReasonCode::INTERNAL_ERROR,
    };
    for (auto r : all) {
        if (s == reason_to_str(r)) return r;
    }
    return std::nullopt;
}

ReasonCode harness_fail_for(Tier t) {
    switch (t) {
        case Tier::T0: return ReasonCode::HARNESS_FAIL_T0;
        case Tier::T1: return ReasonCode::HARNESS_FAIL_T1;
        case Tier::T2: return ReasonCode::HARNESS_FAIL_T2;
        case Tier::T3: return ReasonCode::HARNESS_FAIL_T3;
        case Tier::T4: return ReasonCode::HARNESS_FAIL_T4;
        case Tier::INTAKE: break;
    }
    return ReasonCode::INTERNAL_ERROR;
}

const char* callstatus_to_str(CallStatus s) {
    switch (s) {
        case CallStatus::OK: return "OK";
        case CallStatus::RAISED: return "RAISED";
        case CallStatus::MALFORMED: return "MALFORMED";
        case CallStatus::UNSERIALIZABLE: return "UNSERIALIZABLE";
        case CallStatus::LINEAGE_MUTATED: return "LINEAGE_MUTATED";
        case CallStatus::TIMEOUT: return "TIMEOUT";
        case CallStatus::RESOURCE: return "RESOURCE";
        case CallStatus::CRASHED: return "CRASHED";
        case CallStatus::CANCELLED: return "CANCELLED";
        case CallStatus::HARNESS_ERROR: return "HARNESS_ERROR";
    }
    return "HARNESS_ERROR";
}

ReasonCode classify_call(CallStatus s, Tier t) {
    switch (s) {
        case CallStatus::OK: return ReasonCode::OK;
        case CallStatus::TIMEOUT: return ReasonCode::NONTERMINATION;
        case CallStatus::RESOURCE: return ReasonCode::RESOURCE_EXHAUSTION;
        case CallStatus::UNSERIALIZABLE:
        case CallStatus::LINEAGE_MUTATED: return ReasonCode::INVARIANT_FAIL;
        case CallStatus::RAISED:
        case CallStatus::MALFORMED:
        case CallStatus::CRASHED: return harness_fail_for(t);
        case CallStatus::CANCELLED:
        case CallStatus::HARNESS_ERROR: return ReasonCode::INTERNAL_ERROR;
    }
    return ReasonCode::INTERNAL_ERROR;
}

const char* audit_verdict_str(AuditVerdict v) {
    switch (v) {
        case AuditVerdict::NONE: return "NONE";
        case AuditVerdict::OK: return "OK";
        case AuditVerdict::HALT: return "HALT";
    }
    return "NONE";
}

std::string Detail::to_json() const {
    // ints and strs never share a key (set() keeps them disjoint)
    std::map<std::string, std::string> merged;
    for (const auto& kv : ints) merged[kv.first] = std::to_string(kv.second);
    for (const auto& kv : strs) merged[kv.first] = "\"" + json_mini::json_escape(kv.second) + "\"";
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& kv : merged) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << json_mini::json_escape(kv.first) << "\":" << kv.second;
    }
    oss << "}";
    return oss.str();
}

} // namespace furnace
