#pragma once
#include "lexpp/Diagnostic.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexpp {

// ── Forward declarations ──────────────────────────────────────────────────────
struct ArithExpr; struct BoolExpr; struct Node;
using ArithExprPtr = std::unique_ptr<ArithExpr>;
using BoolExprPtr  = std::unique_ptr<BoolExpr>;

// Nodes are shared: macro definitions keep their bodies alive after the
// tree they were parsed from is gone.
using NodePtr  = std::shared_ptr<const Node>;
using NodeList = std::vector<NodePtr>;

// =============================================================================
// ARITHMETIC EXPRESSIONS (signed 64-bit)
// =============================================================================

enum class ArithKind {
    Int,            // 42
    Ident,          // NAME, must be bound to an int literal
    Neg,            // -x
    Add, Sub, Mul,
    Div, Mod,       // location-tagged for division by zero
    Lnot,           // lnot x
    Lsl, Lsr, Asr,  // shifts; |amount| >= 64 yields 0
    Land, Lor, Lxor,
};

const char *kindName(ArithKind k);

struct ArithExpr {
    ArithKind      kind;
    SourceLocation loc;

    ArithExpr(ArithKind k, SourceLocation l) : kind(k), loc(std::move(l)) {}
    virtual ~ArithExpr() = default;
};

struct IntArith : ArithExpr {
    int64_t value;
    IntArith(int64_t v, SourceLocation l)
        : ArithExpr(ArithKind::Int, std::move(l)), value(v) {}
};

struct IdentArith : ArithExpr {
    std::string name;
    IdentArith(std::string n, SourceLocation l)
        : ArithExpr(ArithKind::Ident, std::move(l)), name(std::move(n)) {}
};

// Neg, Lnot
struct UnaryArith : ArithExpr {
    ArithExprPtr operand;
    UnaryArith(ArithKind k, ArithExprPtr e, SourceLocation l)
        : ArithExpr(k, std::move(l)), operand(std::move(e)) {}
};

// Every binary operator; `loc` spans the whole operation.
struct BinaryArith : ArithExpr {
    ArithExprPtr left, right;
    BinaryArith(ArithKind k, ArithExprPtr a, ArithExprPtr b, SourceLocation l)
        : ArithExpr(k, std::move(l)), left(std::move(a)), right(std::move(b)) {}
};

// =============================================================================
// BOOLEAN EXPRESSIONS
// =============================================================================

enum class BoolKind {
    True, False,
    Defined,        // defined(NAME)
    Not, And, Or,
    Eq, Lt, Gt,     // operands are arithmetic
};

const char *kindName(BoolKind k);

struct BoolExpr {
    BoolKind       kind;
    SourceLocation loc;

    BoolExpr(BoolKind k, SourceLocation l) : kind(k), loc(std::move(l)) {}
    virtual ~BoolExpr() = default;
};

// True, False
struct ConstBool : BoolExpr {
    ConstBool(bool v, SourceLocation l)
        : BoolExpr(v ? BoolKind::True : BoolKind::False, std::move(l)) {}
};

struct DefinedBool : BoolExpr {
    std::string name;
    DefinedBool(std::string n, SourceLocation l)
        : BoolExpr(BoolKind::Defined, std::move(l)), name(std::move(n)) {}
};

struct NotBool : BoolExpr {
    BoolExprPtr operand;
    NotBool(BoolExprPtr e, SourceLocation l)
        : BoolExpr(BoolKind::Not, std::move(l)), operand(std::move(e)) {}
};

// And, Or
struct LogicalBool : BoolExpr {
    BoolExprPtr left, right;
    LogicalBool(BoolKind k, BoolExprPtr a, BoolExprPtr b, SourceLocation l)
        : BoolExpr(k, std::move(l)), left(std::move(a)), right(std::move(b)) {}
};

// Eq, Lt, Gt
struct CompareBool : BoolExpr {
    ArithExprPtr left, right;
    CompareBool(BoolKind k, ArithExprPtr a, ArithExprPtr b, SourceLocation l)
        : BoolExpr(k, std::move(l)), left(std::move(a)), right(std::move(b)) {}
};

// =============================================================================
// NODES
// =============================================================================

enum class NodeKind {
    Ident,          // NAME or NAME(arg, ...)
    Def,            // #define NAME body
    Defun,          // #define NAME(params) body
    Undef,          // #undef NAME
    Include,        // #include "path"
    Cond,           // #if / #ifdef / #ifndef ... #else ... #endif
    Error,          // #error "msg"
    Warning,        // #warning "msg"
    Text,           // literal text, whitespace or not
    Seq,            // grouped nodes
    Line,           // # N "file"
    CurrentLine,    // __LINE__
    CurrentFile,    // __FILE__
};

const char *kindName(NodeKind k);

struct Node {
    NodeKind       kind;
    SourceLocation loc;

    Node(NodeKind k, SourceLocation l) : kind(k), loc(std::move(l)) {}
    virtual ~Node() = default;
};

struct IdentNode : Node {
    std::string                          name;
    std::optional<std::vector<NodeList>> args;   // nullopt: not a call
    IdentNode(std::string n, std::optional<std::vector<NodeList>> a, SourceLocation l)
        : Node(NodeKind::Ident, std::move(l)), name(std::move(n)), args(std::move(a)) {}
};

struct DefNode : Node {
    std::string name;
    NodeList    body;
    DefNode(std::string n, NodeList b, SourceLocation l)
        : Node(NodeKind::Def, std::move(l)), name(std::move(n)), body(std::move(b)) {}
};

struct DefunNode : Node {
    std::string              name;
    std::vector<std::string> params;
    NodeList                 body;
    DefunNode(std::string n, std::vector<std::string> p, NodeList b, SourceLocation l)
        : Node(NodeKind::Defun, std::move(l)), name(std::move(n)),
          params(std::move(p)), body(std::move(b)) {}
};

struct UndefNode : Node {
    std::string name;
    UndefNode(std::string n, SourceLocation l)
        : Node(NodeKind::Undef, std::move(l)), name(std::move(n)) {}
};

struct IncludeNode : Node {
    std::string path;
    IncludeNode(std::string p, SourceLocation l)
        : Node(NodeKind::Include, std::move(l)), path(std::move(p)) {}
};

struct CondNode : Node {
    BoolExprPtr test;
    NodeList    ifTrue, ifFalse;
    CondNode(BoolExprPtr t, NodeList a, NodeList b, SourceLocation l)
        : Node(NodeKind::Cond, std::move(l)), test(std::move(t)),
          ifTrue(std::move(a)), ifFalse(std::move(b)) {}
};

// Error, Warning
struct MessageNode : Node {
    std::string message;
    MessageNode(NodeKind k, std::string m, SourceLocation l)
        : Node(k, std::move(l)), message(std::move(m)) {}
};

struct TextNode : Node {
    bool        isSpace;
    std::string text;
    TextNode(bool space, std::string t, SourceLocation l)
        : Node(NodeKind::Text, std::move(l)), isSpace(space), text(std::move(t)) {}
};

struct SeqNode : Node {
    NodeList children;
    SeqNode(NodeList c, SourceLocation l)
        : Node(NodeKind::Seq, std::move(l)), children(std::move(c)) {}
};

struct LineNode : Node {
    std::optional<std::string> file;
    int64_t                    line;
    LineNode(std::optional<std::string> f, int64_t n, SourceLocation l)
        : Node(NodeKind::Line, std::move(l)), file(std::move(f)), line(n) {}
};

// CurrentLine, CurrentFile
struct MarkerNode : Node {
    MarkerNode(NodeKind k, SourceLocation l) : Node(k, std::move(l)) {}
};

} // namespace lexpp
