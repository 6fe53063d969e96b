#pragma once

#include "pmatch/storage/match_repository.h"

#include <ostream>

// execute_show: print the latest stored run (timestamp, solver, diagnostics) as JSON.
// Returns 0 when a run was printed, 1 when the store holds no run, 2 on a read error.
int execute_show(const pmatch::storage::IMatchRepository& repository, std::ostream& out,
                 std::ostream& err);
