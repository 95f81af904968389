#pragma once
#include "lexpp/AST.h"
#include "lexpp/Diagnostic.h"
#include "lexpp/Environment.h"
#include "lexpp/SourceLoader.h"
#include <optional>
#include <set>
#include <string>

namespace lexpp {

// ── Options ───────────────────────────────────────────────────────────────────
struct ExpandOptions {
    bool lineMarkers = true;   // --no-line-markers: drop owed "# N" markers
};

// ── Expander ──────────────────────────────────────────────────────────────────
// Walks parsed nodes depth-first, threading the environment from each node to
// the next sibling and appending output text to `out`. Every failure throws
// PreprocError; whatever is already in `out` at that point is meaningless.
//
// Output carries line markers ("\n# N \"file\"\n" plus indentation) so that
// downstream tools can map text back to its source. A marker is owed after
// every directive and macro use and is written before the next
// non-whitespace text.
class Expander {
public:
    Expander(std::string &out, DiagEngine &diag, SourceLoader &loader,
             ExpandOptions opts = {});

    // Expand one top-level source. The source gets its own inclusion
    // ancestry (the loader's key for `name`) and starts with a marker owed.
    Environment expandSource(const std::string &name, const NodeList &nodes,
                             Environment env);

private:
    // Per-call state. Copied, never mutated, when a recursive call extends it.
    struct Context {
        std::set<std::string>         ancestry;   // keys of the active #include chain
        std::optional<SourceLocation> callLoc;    // outermost macro use
    };

    Environment expandList(const Context &ctx, Environment env, const NodeList &nodes);
    Environment expandNode(const Context &ctx, Environment env, const Node &node);

    Environment expandIdent(const Context &ctx, Environment env, const IdentNode &n);
    Environment expandUnboundCall(const Context &ctx, Environment env, const IdentNode &n);
    Environment expandFunction(const Context &ctx, Environment env,
                               const MacroDef &def, const IdentNode &n);
    Environment define(Environment env, MacroDefPtr def);
    Environment includeFile(const Context &ctx, Environment env, const IncludeNode &n);
    void        expandMarker(const Context &ctx, const MarkerNode &n);
    void        emitText(const SourcePosition &pos, const std::string &text);

    // Writes the owed marker, if any, for text starting at `pos`. Callers
    // clear requireLocation_ afterwards.
    void maybePrintLocation(const SourcePosition &pos);

    std::string               &out_;
    DiagEngine                &diag_;
    SourceLoader              &loader_;
    ExpandOptions              opts_;
    bool                       requireLocation_ = true;
    std::optional<std::string> lastFile_;
};

} // namespace lexpp
