#pragma once
#include "lexpp/AST.h"
#include "lexpp/Token.h"
#include "lexpp/Diagnostic.h"
#include <string>
#include <vector>

namespace lexpp {

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // Parse a whole file into a node list. Throws a Syntax PreprocError.
    NodeList parseFile();

private:
    // ── Token stream ──────────────────────────────────────────────────────────
    const Token &cur()  const { return toks_[pos_]; }
    const Token &peek(size_t offset = 1) const {
        size_t idx = pos_ + offset;
        return (idx < toks_.size()) ? toks_[idx] : toks_.back();
    }
    Token consume();
    Token expect(TK kind, const char *what);
    bool  check(TK k)  const { return cur().is(k); }
    bool  match(TK k);
    bool  atEnd()      const { return cur().is(TK::Eof); }
    bool  atDirective(const char *name) const {
        return cur().is(TK::Directive) && cur().text == name;
    }

    [[noreturn]] void fail(const SourceLocation &loc, const std::string &msg) const;

    // ── Nodes ─────────────────────────────────────────────────────────────────
    NodeList parseBlock();          // stops at #elif / #else / #endif / EOF
    NodePtr  parseNode();
    NodePtr  parseTextToken();
    NodePtr  parseIdent();
    std::vector<NodeList> parseCallArgs(const Token &name);

    // ── Directives ────────────────────────────────────────────────────────────
    NodePtr  parseDirective();
    NodePtr  parseDefine(const Token &dir);
    NodePtr  parseConditional(const Token &dir, BoolExprPtr test);
    NodePtr  parseLine(const Token &dir);
    SourceLocation endDirective(const Token &dir);

    // ── #if expressions ───────────────────────────────────────────────────────
    BoolExprPtr  parseBoolExpr();
    BoolExprPtr  parseOr();
    BoolExprPtr  parseAnd();
    BoolExprPtr  parseNot();
    BoolExprPtr  parseBoolAtom();
    BoolExprPtr  parseComparison();

    ArithExprPtr parseArith();
    ArithExprPtr parseMul();
    ArithExprPtr parseShift();
    ArithExprPtr parseUnary();
    ArithExprPtr parsePrimary();

    // ── Helpers ───────────────────────────────────────────────────────────────
    bool   isArithBinaryOp(const Token &t) const;
    bool   isComparisonOp(const Token &t) const;
    size_t matchingParen(size_t open) const;   // index of the ')' or npos

    std::vector<Token> toks_;
    size_t             pos_ = 0;
};

// Lex and parse `source`; positions name `filename`.
NodeList parseSource(std::string source, std::string filename);

} // namespace lexpp
