#pragma once

// Queue subcommands of the seqrun CLI. Each takes the full argv
// (argv[1] is the subcommand) and returns the process exit code.
int cmd_add(int argc, char** argv);
int cmd_status(int argc, char** argv);
int cmd_remove(int argc, char** argv);
int cmd_stop(int argc, char** argv);
int cmd_clear(int argc, char** argv);
int cmd_logs(int argc, char** argv);
int cmd_joblog(int argc, char** argv);
