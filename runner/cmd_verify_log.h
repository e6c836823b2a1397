#pragma once

// furnace_cli verify_log <outcome_log>
int cmd_verify_log(int argc, char** argv);
