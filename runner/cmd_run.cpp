#include "cmd_run.h"

#include "furnace/cancel.h"
#include "furnace/config.h"
#include "furnace/pipeline.h"
#include "furnace/verdict.h"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

using namespace furnace;

static CancelToken g_cancel;

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: furnace_cli run <artifact.zip|artifact_dir>\n";
        std::cerr << "env: FURNACE_PROFILE=dev|prod, FURNACE_HOME, FURNACE_RUNTIME, FURNACE_RUNTIME_PIN\n";
        return 2;
    }
    std::filesystem::path artifact = argv[2];
    std::error_code ec;
    if (!std::filesystem::exists(artifact, ec)) {
        std::cerr << "artifact not found: " << artifact.string() << "\n";
        return 2;
    }
    if (!artifact.is_absolute()) artifact = std::filesystem::absolute(artifact, ec);

    // SIGINT/SIGTERM kill the live sandbox and end the run with a verdict
    std::signal(SIGTERM, [](int) { g_cancel.cancel(); });
    std::signal(SIGINT, [](int) { g_cancel.cancel(); });

    Profile profile = detect_profile();
    apply_profile_defaults(profile);
    HarnessConfig cfg = load_harness_config();

    std::cout << "furnace " << kHarnessVersion << " profile=" << profile_name(profile) << "\n";
    std::cout << "artifact: " << artifact.filename().string() << "\n";

    PipelineResult res;
    try {
        Furnace furnace(cfg);
        furnace.set_cancel(&g_cancel);
        furnace.set_progress([](const TierResult& r) { std::cout << render_tier_line(r) << "\n" << std::flush; });
        res = furnace.execute(artifact);
    } catch (const std::exception& e) {
        std::cerr << "[furnace] fatal: " << e.what() << "\n";
        RunHeader hdr;
        Detail d;
        d.set("stage", std::string("cli"));
        Verdict v = intake_verdict(hdr, artifact.filename().string(), ReasonCode::INTERNAL_ERROR, d, "");
        std::cout << render_verdict_block(v);
        return 1;
    }

    if (!res.error.empty()) {
        std::cerr << "[furnace] persistence error: " << res.error << "\n";
    }
    std::cout << render_verdict_block(res.verdict);
    if (res.outcome_seq > 0) std::cout << "outcome_log_seq: " << res.outcome_seq << "\n";
    return res.verdict.exit_code();
}
