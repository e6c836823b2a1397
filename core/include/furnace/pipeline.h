#pragma once

// Pipeline: one artifact in, one verdict out.
//   loader -> (runtime pin) -> tier controller -> verdict reporter
// Each execute() owns its arena, sandbox runner and run log. The outcome log
// is the only thing shared between runs.

#include "furnace/cancel.h"
#include "furnace/config.h"
#include "furnace/schedule.h"
#include "furnace/sandbox.h"
#include "furnace/tier_controller.h"
#include "furnace/verdict.h"

#include <filesystem>
#include <memory>
#include <string>

namespace furnace {

struct PipelineResult {
    Verdict verdict;

    int64_t outcome_seq{0};   // seq of the outcome log entry (0 if not appended)
    std::string outcome_head; // chain head after the append
    std::filesystem::path run_log;
    std::filesystem::path outcome_record;
    std::filesystem::path survivor_path;

    int64_t sandboxes_created{0};
    int64_t sandboxes_destroyed{0};

    // Harness-side persistence problems (outcome log, record, promotion).
    // The verdict itself stands regardless.
    std::string error;
};

// Maps HarnessConfig onto per-instance sandbox limits.
SandboxLimits sandbox_limits_from(const HarnessConfig& cfg);

class Furnace {
public:
    explicit Furnace(HarnessConfig cfg);

    void set_progress(TierProgressFn fn) { progress_ = std::move(fn); }
    void set_cancel(const CancelToken* cancel) { cancel_ = cancel; }
    // Defaults to frozen_schedules(); tests substitute smaller ones.
    void set_schedules(const Schedules& s) { sched_ = s; }

    const HarnessConfig& config() const { return cfg_; }

    PipelineResult execute(const std::filesystem::path& artifact);

private:
    Verdict run_tiers(const std::filesystem::path& artifact, RunHeader& hdr, JsonlLogger& log,
                      PipelineResult& out, std::filesystem::path* survivor_src, std::unique_ptr<Arena>* arena);
    void finalize(PipelineResult& out, JsonlLogger& log, const std::filesystem::path& survivor_src);

    HarnessConfig cfg_;
    Schedules sched_;
    TierProgressFn progress_;
    const CancelToken* cancel_{nullptr};
};

} // namespace furnace
