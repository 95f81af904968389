#include "lexpp/Driver.h"
#include "lexpp/Parser.h"
#include "lexpp/Predefine.h"
#include "lexpp/SourceLoader.h"
#include <cstdio>

namespace lexpp {

bool preprocess(const DriverOptions &opts, DiagEngine &diag, std::string &out) {
    std::vector<std::string> inputs = opts.inputs;
    if (inputs.empty()) inputs.push_back("-");

    try {
        // ── 1. Command-line definitions ───────────────────────────────────────
        Environment env = predefine(opts.defines, opts.undefines, diag);
        if (opts.verbose)
            fprintf(stderr, "[lexpp] %zu macro(s) predefined\n", env.size());

        FileSourceLoader loader(opts.includeDirs);
        Expander         expander(out, diag, loader, opts.expand);

        // ── 2. Inputs, in order ───────────────────────────────────────────────
        for (auto &input : inputs) {
            bool        isStdin = (input == "-");
            std::string name    = isStdin ? "<stdin>" : input;
            if (opts.verbose) fprintf(stderr, "[lexpp] Expanding %s ...\n", name.c_str());

            std::string src = isStdin ? readStdin() : readSourceFile(input, "input file");
            NodeList nodes  = parseSource(std::move(src), name);
            if (opts.verbose)
                fprintf(stderr, "[lexpp] Parsed %zu top-level node(s)\n", nodes.size());

            env = expander.expandSource(name, nodes, std::move(env));
        }

        if (opts.verbose)
            fprintf(stderr, "[lexpp] Done (%zu macro(s) defined, %d warning(s))\n",
                    env.size(), diag.warningCount());
        return true;
    } catch (const PreprocError &e) {
        diag.report(e);
        return false;
    }
}

} // namespace lexpp
