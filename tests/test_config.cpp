#include "test_common.h"
#include "furnace/config.h"
#include "furnace/pipeline.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("FURNACE_PROFILE");
    auto p = furnace::detect_profile();
    expect_true(p == furnace::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("FURNACE_PROFILE", "prod", 1);
    expect_true(furnace::detect_profile() == furnace::Profile::PROD, "should detect PROD");
    setenv("FURNACE_PROFILE", "PRODUCTION", 1);
    expect_true(furnace::detect_profile() == furnace::Profile::PROD, "should detect PRODUCTION");

    // Test 3: Apply defaults (won't override existing)
    setenv("FURNACE_OUTCOME_FSYNC", "0", 1);
    unsetenv("FURNACE_SECCOMP_ENABLE");
    unsetenv("FURNACE_NET_ISOLATION_REQUIRED");
    furnace::apply_profile_defaults(furnace::Profile::PROD);
    std::string val = std::getenv("FURNACE_OUTCOME_FSYNC") ? std::getenv("FURNACE_OUTCOME_FSYNC") : "";
    expect_true(val == "0", "should NOT override pre-existing env var");
    val = std::getenv("FURNACE_SECCOMP_ENABLE") ? std::getenv("FURNACE_SECCOMP_ENABLE") : "";
    expect_true(val == "1", "PROD should enable seccomp");

    // Test 4: HarnessConfig snapshot
    setenv("FURNACE_HOME", "/tmp/furnace_cfg_home", 1);
    setenv("FURNACE_WORKSPACE_LIMIT_MB", "4", 1);
    setenv("FURNACE_SANDBOX_TIMEOUT_MS", "1500", 1);
    setenv("FURNACE_RUNTIME_PIN", "3.11", 1);
    unsetenv("FURNACE_SANDBOX_WRAPPER_ENABLE");
    setenv("FURNACE_SANDBOX_WRAPPER", "bwrap --unshare-all", 1);
    auto cfg = furnace::load_harness_config();
    expect_true(cfg.profile == furnace::Profile::PROD, "config carries the profile");
    expect_true(cfg.home == "/tmp/furnace_cfg_home", "FURNACE_HOME");
    expect_eq_ll(cfg.workspace_limit_bytes, 4LL * 1024 * 1024, "workspace limit in MiB");
    expect_eq_ll(cfg.sandbox_timeout_ms, 1500, "sandbox timeout");
    expect_true(cfg.runtime == "python3", "default runtime");
    expect_true(cfg.runtime_pin == "3.11", "runtime pin");
    expect_true(cfg.seccomp, "seccomp from profile default");
    expect_true(cfg.net_isolation_required, "net isolation from profile default");
    expect_true(cfg.wrapper.empty(), "wrapper ignored unless enabled");
    expect_true(cfg.outcome_log_path() == "/tmp/furnace_cfg_home/results/OUTCOME_LOG.jsonl", "outcome log path");

    setenv("FURNACE_SANDBOX_WRAPPER_ENABLE", "1", 1);
    cfg = furnace::load_harness_config();
    auto lim = furnace::sandbox_limits_from(cfg);
    expect_eq_ll((long long)lim.wrapper.size(), 2, "wrapper split into argv");
    expect_true(lim.net == furnace::NetIsolation::REQUIRED, "required netns in prod");
    expect_eq_ll((long long)lim.fsize_mb, 4, "fsize follows workspace limit");

    // Test 5: Profile name
    expect_true(std::string(furnace::profile_name(furnace::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(furnace::profile_name(furnace::Profile::PROD)) == "prod", "prod name");

    // Test 6: run ids
    unsetenv("FURNACE_DETERMINISTIC_RUN_ID");
    auto a = furnace::gen_run_id();
    auto b = furnace::gen_run_id();
    expect_eq_ll((long long)a.size(), 32, "run id length");
    expect_true(a != b, "run ids differ");
    setenv("FURNACE_DETERMINISTIC_RUN_ID", "1", 1);
    expect_true(furnace::gen_run_id() == furnace::gen_run_id(), "deterministic run id");

    // Cleanup
    for (const char* k : {"FURNACE_PROFILE", "FURNACE_OUTCOME_FSYNC", "FURNACE_SECCOMP_ENABLE",
                          "FURNACE_NET_ISOLATION_REQUIRED", "FURNACE_SANDBOX_TIMEOUT_MS", "FURNACE_KEEP_ARENA",
                          "FURNACE_HOME", "FURNACE_WORKSPACE_LIMIT_MB", "FURNACE_RUNTIME_PIN",
                          "FURNACE_SANDBOX_WRAPPER", "FURNACE_SANDBOX_WRAPPER_ENABLE",
                          "FURNACE_DETERMINISTIC_RUN_ID"}) {
        unsetenv(k);
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
