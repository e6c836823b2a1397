#include "cmd_verify_log.h"

#include "furnace/config.h"
#include "furnace/outcome_log.h"

#include <iostream>

using namespace furnace;

int cmd_verify_log(int argc, char** argv) {
    std::filesystem::path path;
    if (argc >= 3) {
        path = argv[2];
    } else {
        apply_profile_defaults(detect_profile());
        path = load_harness_config().outcome_log_path();
    }

    LogVerifyResult r = verify_outcome_log(path);
    if (!r.ok) {
        std::cout << "OUTCOME LOG: BROKEN at line " << r.bad_line << ": " << r.error << "\n";
        std::cout << "verified entries: " << r.entries << "\n";
        return 1;
    }
    std::cout << "OUTCOME LOG: OK (" << r.entries << " entries)\n";
    std::cout << "head: " << r.head << "\n";
    return 0;
}
