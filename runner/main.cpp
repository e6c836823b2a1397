#include "cmd_run.h"
#include "cmd_verify_log.h"

#include "furnace/types.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "furnace_cli <run|verify_log|version> ...\n";
        std::cerr << "       furnace_cli <artifact>\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "verify_log") return cmd_verify_log(argc, argv);
    if (cmd == "version") {
        std::cout << furnace::kHarnessVersion << "\n";
        return 0;
    }
    if (!cmd.empty() && cmd[0] == '-') {
        std::cerr << "unknown option: " << cmd << "\n";
        return 2;
    }

    // bare artifact path: shorthand for `run <artifact>`
    std::vector<char*> args = {argv[0], const_cast<char*>("run"), argv[1]};
    return cmd_run((int)args.size(), args.data());
}
