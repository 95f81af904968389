#pragma once
#include "lexpp/Diagnostic.h"
#include <cstdint>
#include <string>

namespace lexpp {

// ── Token kinds ───────────────────────────────────────────────────────────────
enum class TK {
    // ── Text mode (source lines and #define bodies) ──────────────────────────
    Ident,          // also __LINE__ / __FILE__
    Space,          // run of blanks and newlines
    Text,           // anything else: numbers, punctuation runs
    StringLit,      // "..." kept verbatim
    CharLit,        // 'x' kept verbatim
    LParen, RParen, Comma,

    // ── Directive framing ─────────────────────────────────────────────────────
    Directive,      // text = directive name ("define", "if", "line", ...)
    Body,           // start of a #define body (text mode until DirectiveEnd)
    DirectiveEnd,

    // ── Directive expressions ─────────────────────────────────────────────────
    IntLit,
    Plus, Minus, Star, Slash, Percent,
    Amp, Pipe, Caret, Tilde,
    LShift, RShift,
    AmpAmp, PipePipe, Bang,
    Eq, EqEq, BangEq, LtGt,
    Lt, Gt, LtEq, GtEq,

    // ── Special ───────────────────────────────────────────────────────────────
    Eof, Invalid
};

struct Token {
    TK             kind   = TK::Invalid;
    std::string    text;        // raw spelling
    SourceLocation loc;

    int64_t     intVal = 0;     // IntLit
    std::string strVal;         // StringLit contents with escapes resolved

    Token() = default;
    Token(TK k, std::string t, SourceLocation l)
        : kind(k), text(std::move(t)), loc(std::move(l)) {}

    bool is   (TK k) const { return kind == k; }
    bool isNot(TK k) const { return kind != k; }
    bool isIdent(const char *name) const {
        return kind == TK::Ident && text == name;
    }
    bool isEof() const { return kind == TK::Eof; }

    const char *kindName() const;
};

} // namespace lexpp
