#pragma once

// gauntlet_cli run <competition.json>
// Exit: 0 every agent succeeded, 1 otherwise, 2 usage/request error.
int cmd_run(int argc, char** argv);
