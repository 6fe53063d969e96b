#pragma once

// cmd_show: print diagnostics of the most recent run stored in a SQLite run history.
// Usage: pmatch_cli show --db <sqlite>
int cmd_show(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
