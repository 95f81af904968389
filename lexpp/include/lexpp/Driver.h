#pragma once
#include "lexpp/Diagnostic.h"
#include "lexpp/Expander.h"
#include <string>
#include <vector>

namespace lexpp {

// ── Options ───────────────────────────────────────────────────────────────────
struct DriverOptions {
    std::vector<std::string> inputs;        // "-" reads stdin; empty = stdin
    std::string              outputFile = "-";
    std::vector<std::string> defines;       // -D NAME[=VALUE]
    std::vector<std::string> undefines;     // -U NAME
    std::vector<std::string> includeDirs;   // -I dirs
    ExpandOptions            expand;
    bool                     verbose = false;
};

// Expand every input in order into `out`, threading one environment through
// all of them. Fatal errors are reported to `diag`; returns false on failure,
// in which case `out` must be discarded.
bool preprocess(const DriverOptions &opts, DiagEngine &diag, std::string &out);

} // namespace lexpp
