#include "lexpp/Expander.h"
#include "lexpp/Eval.h"
#include <cstdlib>

namespace lexpp {

static const char *plural(int64_t n) {
    return std::llabs(n) <= 1 ? "" : "s";
}

// ── Constructor ───────────────────────────────────────────────────────────────
Expander::Expander(std::string &out, DiagEngine &diag, SourceLoader &loader,
                   ExpandOptions opts)
    : out_(out), diag_(diag), loader_(loader), opts_(opts) {}

Environment Expander::expandSource(const std::string &name, const NodeList &nodes,
                                   Environment env) {
    requireLocation_ = true;
    lastFile_.reset();
    Context ctx;
    ctx.ancestry.insert(loader_.identify(name));
    return expandList(ctx, std::move(env), nodes);
}

// =============================================================================
// Line markers
// =============================================================================

void Expander::maybePrintLocation(const SourcePosition &pos) {
    if (!requireLocation_) return;
    if (opts_.lineMarkers) {
        bool sameFile = lastFile_ && *lastFile_ == pos.file;
        out_ += '\n';
        out_ += lineDirective(pos, !sameFile);
    }
    lastFile_ = pos.file;
}

void Expander::emitText(const SourcePosition &pos, const std::string &text) {
    maybePrintLocation(pos);
    requireLocation_ = false;
    out_ += text;
}

// =============================================================================
// Walk
// =============================================================================

Environment Expander::expandList(const Context &ctx, Environment env,
                                 const NodeList &nodes) {
    for (auto &n : nodes)
        env = expandNode(ctx, std::move(env), *n);
    return env;
}

Environment Expander::expandNode(const Context &ctx, Environment env, const Node &node) {
    switch (node.kind) {
    case NodeKind::Ident:
        return expandIdent(ctx, std::move(env), static_cast<const IdentNode &>(node));

    case NodeKind::Def: {
        auto &n = static_cast<const DefNode &>(node);
        return define(env, MacroDef::object(n.name, n.body, env, n.loc));
    }
    case NodeKind::Defun: {
        auto &n = static_cast<const DefunNode &>(node);
        return define(env, MacroDef::function(n.name, n.params, n.body, env, n.loc));
    }
    case NodeKind::Undef: {
        requireLocation_ = true;
        return env.unbind(static_cast<const UndefNode &>(node).name);
    }
    case NodeKind::Include:
        return includeFile(ctx, std::move(env), static_cast<const IncludeNode &>(node));

    case NodeKind::Cond: {
        auto &n = static_cast<const CondNode &>(node);
        const NodeList &branch = evalBool(env, *n.test) ? n.ifTrue : n.ifFalse;
        requireLocation_ = true;
        env = expandList(ctx, std::move(env), branch);
        requireLocation_ = true;   // text after #endif
        return env;
    }
    case NodeKind::Error:
        throw PreprocError(ErrorKind::User,
                           static_cast<const MessageNode &>(node).message, node.loc);

    case NodeKind::Warning:
        diag_.warn(node.loc, static_cast<const MessageNode &>(node).message);
        return env;

    case NodeKind::Text: {
        auto &n = static_cast<const TextNode &>(node);
        if (n.isSpace) out_ += n.text;
        else           emitText(n.loc.start, n.text);
        return env;
    }
    case NodeKind::Seq:
        return expandList(ctx, std::move(env), static_cast<const SeqNode &>(node).children);

    case NodeKind::Line: {
        auto &n = static_cast<const LineNode &>(node);
        requireLocation_ = true;
        out_ += "\n# " + std::to_string(n.line);
        if (n.file) out_ += " " + quoteString(*n.file);
        out_ += '\n';
        return env;
    }
    case NodeKind::CurrentLine:
    case NodeKind::CurrentFile:
        expandMarker(ctx, static_cast<const MarkerNode &>(node));
        return env;
    }
    return env;
}

// ── Identifiers ───────────────────────────────────────────────────────────────
Environment Expander::expandIdent(const Context &ctx, Environment env,
                                  const IdentNode &n) {
    MacroDefPtr def = env.lookup(n.name);

    if (!def) {
        if (!n.args) {
            emitText(n.loc.start, n.name);
            return env;
        }
        return expandUnboundCall(ctx, std::move(env), n);
    }

    requireLocation_ = true;

    // The outermost macro use is what __LINE__ / __FILE__ report.
    Context inner;
    const Context *use = &ctx;
    if (!ctx.callLoc) {
        inner.ancestry = ctx.ancestry;
        inner.callLoc  = n.loc;
        use = &inner;
    }

    if (def->isFunction()) {
        if (!n.args)
            throw PreprocError(ErrorKind::Arity,
                quoteString(n.name) + " expects " + std::to_string(def->params.size()) +
                " arguments but is applied to none.", n.loc);
        expandFunction(*use, env, *def, n);
        return env;
    }

    if (n.args)
        throw PreprocError(ErrorKind::Name,
                           quoteString(n.name) + " expects no arguments", n.loc);

    // The body's own definitions stay local to it.
    expandList(*use, def->env, def->body);
    return env;
}

// An unknown name followed by arguments is passed through; each argument is
// still expanded.
Environment Expander::expandUnboundCall(const Context &ctx, Environment env,
                                        const IdentNode &n) {
    const SourcePosition &pos = n.loc.start;
    emitText(pos, n.name + "(");
    bool first = true;
    for (auto &arg : *n.args) {
        if (!first) emitText(pos, ",");
        first = false;
        env = expandList(ctx, std::move(env), arg);
    }
    emitText(pos, ")");
    return env;
}

Environment Expander::expandFunction(const Context &ctx, Environment env,
                                     const MacroDef &def, const IdentNode &n) {
    std::vector<NodeList> args = *n.args;
    const size_t argc = def.params.size();

    // F() supplies one empty argument when F takes one parameter.
    if (args.empty() && argc == 1)
        args.emplace_back();

    if (args.size() != argc) {
        auto expected = static_cast<int64_t>(argc);
        auto applied  = static_cast<int64_t>(args.size());
        throw PreprocError(ErrorKind::Arity,
            quoteString(n.name) + " expects " + std::to_string(expected) +
            " argument" + plural(expected) + " but is applied to " +
            std::to_string(applied) + " argument" + plural(applied) + ".", n.loc);
    }

    // Parameters are object-macros closed over the caller's environment.
    Environment appEnv = def.env;
    for (size_t i = 0; i < argc; ++i)
        appEnv = appEnv.bind(MacroDef::object(def.params[i], std::move(args[i]), env, n.loc));

    expandList(ctx, std::move(appEnv), def.body);
    return env;
}

Environment Expander::define(Environment env, MacroDefPtr def) {
    requireLocation_ = true;
    if (env.contains(def->name))
        throw PreprocError(ErrorKind::Name,
                           quoteString(def->name) + " is already defined", def->loc);
    return env.bind(std::move(def));
}

// ── Includes ──────────────────────────────────────────────────────────────────
Environment Expander::includeFile(const Context &ctx, Environment env,
                                  const IncludeNode &n) {
    requireLocation_ = true;
    std::string located = loader_.locate(n.path, n.loc);
    std::string key     = loader_.identify(located);
    if (ctx.ancestry.count(key))
        throw PreprocError(ErrorKind::Cycle,
                           "Cyclic inclusion of file " + quoteString(n.path), n.loc);

    NodeList nodes = loader_.load(located, n.loc);

    Context inner = ctx;
    inner.ancestry.insert(key);
    env = expandList(inner, std::move(env), nodes);
    requireLocation_ = true;       // back in the includer
    return env;
}

// ── __LINE__ / __FILE__ ───────────────────────────────────────────────────────
void Expander::expandMarker(const Context &ctx, const MarkerNode &n) {
    maybePrintLocation(n.loc.start);
    const SourcePosition &pos = ctx.callLoc ? ctx.callLoc->start : n.loc.start;
    if (n.kind == NodeKind::CurrentLine)
        out_ += " " + std::to_string(pos.line) + " ";
    else
        out_ += " " + quoteString(pos.file) + " ";
    requireLocation_ = true;
}

} // namespace lexpp
