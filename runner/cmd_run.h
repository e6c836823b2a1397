#pragma once

// furnace_cli run <artifact>
int cmd_run(int argc, char** argv);
