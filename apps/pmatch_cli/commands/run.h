#pragma once

// cmd_run: match a profile collection against a record collection.
// Usage: pmatch_cli run --profiles <file> --records <file> --output <file>
//                       [--config <file>] [--mode auto|exact|heuristic] [--workers N]
//                       [--db <sqlite>] [--fixed-clock <iso8601>]
// With --fixed-clock, reruns over identical inputs write byte-identical artifacts.
int cmd_run(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
