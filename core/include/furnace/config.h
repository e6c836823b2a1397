#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace furnace {

enum class Profile { DEV, PROD };

// Detect profile from FURNACE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no fsync, no seccomp, network isolation best-effort)
// PROD: strict (fsync on, seccomp enabled, network isolation required)
void apply_profile_defaults(Profile p);

// env helpers (unset or unparsable -> default)
int64_t getenv_i64(const char* k, int64_t defv);
bool getenv_bool(const char* k, bool defv);
std::string getenv_str(const char* k, const std::string& defv);

// Snapshot of the FURNACE_* environment for one harness process.
struct HarnessConfig {
    Profile profile{Profile::DEV};
    std::filesystem::path home;          // FURNACE_HOME, default $HOME/.furnace

    std::string runtime{"python3"};      // FURNACE_RUNTIME
    std::string runtime_pin;             // FURNACE_RUNTIME_PIN ("3.11" / "3.11.4"), empty = unpinned

    int64_t sandbox_timeout_ms{300000};  // FURNACE_SANDBOX_TIMEOUT_MS
    int64_t sandbox_mem_mb{1024};        // FURNACE_SANDBOX_MEM_MB (address space)
    int64_t sandbox_cpu_sec{120};        // FURNACE_SANDBOX_CPU_SEC
    int64_t workspace_limit_bytes{16LL * 1024 * 1024}; // FURNACE_WORKSPACE_LIMIT_MB

    bool seccomp{false};                 // FURNACE_SECCOMP_ENABLE
    bool net_isolation_required{false};  // FURNACE_NET_ISOLATION_REQUIRED
    std::string wrapper;                 // FURNACE_SANDBOX_WRAPPER (used when *_ENABLE=1)

    bool outcome_fsync{false};           // FURNACE_OUTCOME_FSYNC
    bool keep_arena{false};              // FURNACE_KEEP_ARENA

    std::filesystem::path results_dir() const { return home / "results"; }
    std::filesystem::path survivors_dir() const { return home / "survivors"; }
    std::filesystem::path logs_dir() const { return home / "logs"; }
    std::filesystem::path outcome_log_path() const { return results_dir() / "OUTCOME_LOG.jsonl"; }
};

// Reads the environment (call apply_profile_defaults first).
HarnessConfig load_harness_config();

// 32 hex chars. FURNACE_DETERMINISTIC_RUN_ID=1 pins the seed.
std::string gen_run_id();

} // namespace furnace
