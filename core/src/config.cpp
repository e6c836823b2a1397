#include "furnace/config.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <random>
#include <sstream>

namespace furnace {

Profile detect_profile() {
    const char* env = std::getenv("FURNACE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("FURNACE_OUTCOME_FSYNC",          "0",      NO_OVERWRITE);
            setenv("FURNACE_SECCOMP_ENABLE",         "0",      NO_OVERWRITE);
            setenv("FURNACE_NET_ISOLATION_REQUIRED", "0",      NO_OVERWRITE);
            setenv("FURNACE_SANDBOX_TIMEOUT_MS",     "300000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("FURNACE_OUTCOME_FSYNC",          "1",      NO_OVERWRITE);
            setenv("FURNACE_SECCOMP_ENABLE",         "1",      NO_OVERWRITE);
            setenv("FURNACE_NET_ISOLATION_REQUIRED", "1",      NO_OVERWRITE);
            setenv("FURNACE_SANDBOX_TIMEOUT_MS",     "300000", NO_OVERWRITE);
            // prod never keeps arenas around
            setenv("FURNACE_KEEP_ARENA",             "0",      NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* k, int64_t defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    char* end = nullptr;
    long long x = std::strtoll(v, &end, 10);
    if (end == v || (end && *end != '\0')) return defv;
    return (int64_t)x;
}

bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    return std::string(v);
}

HarnessConfig load_harness_config() {
    HarnessConfig c;
    c.profile = detect_profile();

    std::string home = getenv_str("FURNACE_HOME", "");
    if (home.empty()) {
        std::string user_home = getenv_str("HOME", "/tmp");
        c.home = std::filesystem::path(user_home) / ".furnace";
    } else {
        c.home = std::filesystem::path(home);
    }

    c.runtime = getenv_str("FURNACE_RUNTIME", "python3");
    c.runtime_pin = getenv_str("FURNACE_RUNTIME_PIN", "");

    c.sandbox_timeout_ms = std::max<int64_t>(1, getenv_i64("FURNACE_SANDBOX_TIMEOUT_MS", 300000));
    c.sandbox_mem_mb = std::max<int64_t>(0, getenv_i64("FURNACE_SANDBOX_MEM_MB", 1024));
    c.sandbox_cpu_sec = std::max<int64_t>(0, getenv_i64("FURNACE_SANDBOX_CPU_SEC", 120));
    c.workspace_limit_bytes =
        std::max<int64_t>(1, getenv_i64("FURNACE_WORKSPACE_LIMIT_MB", 16)) * 1024 * 1024;

    c.seccomp = getenv_bool("FURNACE_SECCOMP_ENABLE", false);
    c.net_isolation_required = getenv_bool("FURNACE_NET_ISOLATION_REQUIRED", c.profile == Profile::PROD);
    if (getenv_bool("FURNACE_SANDBOX_WRAPPER_ENABLE", false)) {
        c.wrapper = getenv_str("FURNACE_SANDBOX_WRAPPER", "");
    }

    c.outcome_fsync = getenv_bool("FURNACE_OUTCOME_FSYNC", false);
    c.keep_arena = getenv_bool("FURNACE_KEEP_ARENA", false);
    return c;
}

std::string gen_run_id() {
    uint64_t seed = 0;
    if (getenv_bool("FURNACE_DETERMINISTIC_RUN_ID", false)) {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            // no entropy source: clock only
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex;
    oss.width(16); oss.fill('0'); oss << a;
    oss.width(16); oss.fill('0'); oss << b;
    return oss.str();
}

} // namespace furnace
