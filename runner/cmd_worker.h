#pragma once

// seqrun worker [--poll_ms N]: runs the worker loop until SIGINT/SIGTERM.
int cmd_worker(int argc, char** argv);
