#pragma once

// Verdict Reporter: folds the tier trail into the terminal verdict and
// renders/persists its public forms.

#include "furnace/engine.h"
#include "furnace/types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace furnace {

constexpr const char* kSurvivorLabel = "SURVIVOR_PHASE_0";
constexpr const char* kOutcomeSchemaVersion = "FURNACE_OUTCOME_V1";

struct Verdict {
    std::string run_id;
    std::string artifact_id;
    std::string artifact_name;
    bool survivor{false};
    Tier tier{Tier::INTAKE}; // failing tier; last executed tier for survivors
    ReasonCode reason{ReasonCode::INTERNAL_ERROR};
    Detail detail;
    std::vector<TierResult> trail;
    std::string schedule_digest;
    std::string harness_version{kHarnessVersion};

    int exit_code() const { return survivor ? 0 : 1; }

    // "SURVIVOR_PHASE_0" | "KILLED_T2" | "KILLED_INTAKE"
    std::string label() const;

    // Canonical JSON (sorted keys): the outcome log record.
    std::string to_json() const;
};

// Fold an executed trail. An empty trail or a trail whose last entry failed
// is a kill; otherwise every tier passed.
Verdict build_verdict(const RunHeader& hdr,
                      const std::string& artifact_name,
                      const std::vector<TierResult>& trail,
                      const std::string& schedule_digest);

// Verdict for a run that never reached T0 (loader or pre-tier failure).
Verdict intake_verdict(const RunHeader& hdr,
                       const std::string& artifact_name,
                       ReasonCode reason,
                       const Detail& detail,
                       const std::string& schedule_digest);

// "[T2 DEGRADATION] PASS (1234 ms)"
std::string render_tier_line(const TierResult& r);

// Console block printed at the end of a run.
std::string render_verdict_block(const Verdict& v);

// Hex part of "sha256:<hex>"; empty when the id is not of that form.
std::string artifact_hex(const std::string& artifact_id);

// Public outcome record (schema FURNACE_OUTCOME_V1).
std::string outcome_record_json(const Verdict& v);

// Writes <results_dir>/<hex>/outcome.json. Returns error string.
std::string write_outcome_record(const Verdict& v,
                                 const std::filesystem::path& results_dir,
                                 std::filesystem::path* written = nullptr);

// Copies a survivor's package to <survivors_dir>/<hex>/, replacing any earlier
// copy. Refuses non-survivors. Returns error string.
std::string promote_survivor(const Verdict& v,
                             const std::filesystem::path& package_root,
                             const std::filesystem::path& survivors_dir,
                             std::filesystem::path* promoted = nullptr);

} // namespace furnace
