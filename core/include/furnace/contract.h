#pragma once

// The fixed three-operation SAIF contract and the probes the early tiers run.
//
//   ingest(event, state)                   -> (new_state, lineage_item)
//   compact(state, lineage, target_bytes)  -> new_state
//   audit(state, lineage)                  -> "OK" | ("HALT", reason)
//
// Bindings are resolved once at load time (package.h). Every call reports a
// sealed CallResult; nothing the artifact does escapes as an exception.

#include "furnace/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace furnace {

class Workspace;

struct OperationBinding {
    std::string op;       // "ingest" | "compact" | "audit"
    std::string function; // top-level function name in mutation.py
};

struct InterfaceContract {
    OperationBinding ingest;
    OperationBinding compact;
    OperationBinding audit;
};

// Positional arity each operation is called with.
constexpr int kIngestArity = 2;
constexpr int kCompactArity = 3;
constexpr int kAuditArity = 2;

struct CallResult {
    CallStatus status{CallStatus::HARNESS_ERROR};
    AuditVerdict verdict{AuditVerdict::NONE}; // audit, or trailing audit after ingest
    std::string halt_reason;                  // artifact-supplied, internal only
    std::vector<std::string> checkpoint_states; // canonical state after each requested checkpoint
    int exit_code{0};
    int64_t elapsed_ms{0};
    std::string detail; // internal diagnostics (error type, output excerpt)

    bool ok() const { return status == CallStatus::OK; }
};

struct IngestOptions {
    // Event counts (1-based, within this batch) after which the state is
    // captured into CallResult::checkpoint_states.
    std::vector<int64_t> checkpoints;
    // Run audit on the final state inside the same sandbox.
    bool audit_after{false};
};

class ISaifContract {
public:
    virtual ~ISaifContract() = default;

    // Feed `events` (JSON documents) through ingest in order, starting from the
    // workspace's state; persists the new state and appends lineage items.
    virtual CallResult ingest(Workspace& ws,
                              const std::vector<std::string>& events,
                              const IngestOptions& opt) = 0;

    virtual CallResult compact(Workspace& ws, int64_t target_bytes) = 0;

    virtual CallResult audit(const Workspace& ws) = 0;
};

class IArtifactProbe {
public:
    virtual ~IArtifactProbe() = default;

    // T0: run SELFTEST.py; OK iff it exits 0.
    virtual CallResult selftest() = 0;

    // T1a: compile mutation.py host-side without executing it.
    virtual CallResult syntax_check() = 0;

    // T1b: import mutation.py in a sandbox and resolve the bound callables.
    virtual CallResult import_check() = 0;
};

} // namespace furnace
