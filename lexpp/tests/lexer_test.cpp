// Tests for the lexer
#include <vector>
#include "TestSupport.h"
#include "lexpp/Lexer.h"

using namespace lexpp;
using lexpp_test::contains;
using lexpp_test::expectError;

static std::vector<Token> lex(const std::string &src) {
    Lexer lexer(src, "t.pp");
    return lexer.lexAll();
}

static std::vector<TK> kinds(const std::vector<Token> &toks) {
    std::vector<TK> out;
    for (auto &t : toks) out.push_back(t.kind);
    return out;
}

static void test_text() {
    auto toks = lex("int x = f(a, 12);\n");
    std::vector<TK> want = {TK::Ident, TK::Space, TK::Ident, TK::Space, TK::Text,
                            TK::Space, TK::Ident, TK::LParen, TK::Ident, TK::Comma,
                            TK::Space, TK::Text, TK::RParen, TK::Text, TK::Space, TK::Eof};
    assert(kinds(toks) == want);
    assert(toks[11].text == "12");
    assert(toks[14].text == "\n");

    // Locations: line, offset and column
    auto two = lex("a\n  b");
    assert(two[2].text == "  ");
    assert(two[3].loc.start.line == 2);
    assert(two[3].loc.start.column() == 2);
    assert(two[3].loc.start.offset == 4);

    // Strings and character literals stay whole
    auto lits = lex("\"a(b,c)\" 'x' '\\n' 'a b");
    assert(lits[0].is(TK::StringLit) && lits[0].text == "\"a(b,c)\"");
    assert(lits[0].strVal == "a(b,c)");
    assert(lits[2].is(TK::CharLit) && lits[2].text == "'x'");
    assert(lits[4].is(TK::CharLit) && lits[4].text == "'\\n'");
    assert(lits[6].is(TK::Text) && lits[6].text == "'");
    assert(lits[7].isIdent("a"));

    auto quote = lex("'\\''");
    assert(quote[0].is(TK::CharLit) && quote[0].text == "'\\''");

    // A top-level string may span lines
    auto multi = lex("\"a\nb\" c");
    assert(multi[0].strVal == "a\nb");
    assert(multi[2].loc.start.line == 2);

    auto err = expectError([] { lex("x \"abc"); });
    assert(err.kind() == ErrorKind::Syntax);
    assert(err.message() == "unterminated string literal");
}

static void test_directives() {
    auto fn = lex("#define F(x, y) x\n");
    std::vector<TK> want = {TK::Directive, TK::Ident, TK::LParen, TK::Ident, TK::Comma,
                            TK::Ident, TK::RParen, TK::Body, TK::Space, TK::Ident,
                            TK::DirectiveEnd, TK::Eof};
    assert(kinds(fn) == want);
    assert(fn[0].text == "define");

    // '(' after a space starts the body
    auto obj = lex("#define F (x) x\n");
    assert(obj[2].is(TK::Body));
    assert(obj[4].is(TK::LParen));

    // Backslash-newline continues a body as a newline
    auto cont = lex("#define X a \\\n  b\nc");
    assert(cont[4].isIdent("a"));
    assert(cont[5].is(TK::Space) && cont[5].text == " \n  ");
    assert(cont[6].isIdent("b"));
    assert(cont[7].is(TK::DirectiveEnd));
    assert(cont[8].isIdent("c") && cont[8].loc.start.line == 3);

    // Leading blanks, blanks after '#'
    auto spaced = lex("  #  ifdef X\n#endif\n");
    assert(spaced[0].is(TK::Directive) && spaced[0].text == "ifdef");
    assert(spaced[1].isIdent("X"));
    assert(spaced[3].text == "endif");

    // Not at the start of a line, or not a directive name: plain text
    auto inline_ = lex("a #define X\n#pragma once\n");
    assert(inline_[2].is(TK::Text) && inline_[2].text == "#");
    assert(inline_[3].isIdent("define"));
    for (auto &t : inline_) assert(t.isNot(TK::Directive));

    // Expression tokens
    auto expr = lex("#if A <= 0x10 && !(B <> 2) || C >= -1 << 2\n");
    std::vector<TK> ew = {TK::Directive, TK::Ident, TK::LtEq, TK::IntLit, TK::AmpAmp,
                          TK::Bang, TK::LParen, TK::Ident, TK::LtGt, TK::IntLit,
                          TK::RParen, TK::PipePipe, TK::Ident, TK::GtEq, TK::Minus,
                          TK::IntLit, TK::LShift, TK::IntLit, TK::DirectiveEnd, TK::Eof};
    assert(kinds(expr) == ew);
    assert(expr[3].intVal == 16);

    auto bad = expectError([] { lex("#if 1 @ 2\n"); });
    assert(contains(bad.message(), "unexpected character '@'"));

    auto badInt = expectError([] { lex("#if 12abc\n"); });
    assert(contains(badInt.message(), "invalid integer literal"));

    // String escapes in directives
    auto inc = lex("#include \"a\\\"b.h\"\n");
    assert(inc[1].is(TK::StringLit) && inc[1].strVal == "a\"b.h");
}

static void test_line_directives() {
    auto toks = lex("# 10 \"foo.c\"\nabc\n");
    assert(toks[0].text == "line");
    assert(toks[1].is(TK::IntLit) && toks[1].intVal == 10);
    assert(toks[2].strVal == "foo.c");
    assert(toks[4].isIdent("abc"));
    assert(toks[4].loc.start.line == 10);
    assert(toks[4].loc.start.file == "foo.c");

    auto keyword = lex("#line 7\nx\n");
    assert(keyword[0].text == "line");
    assert(keyword[3].loc.start.line == 7);
    assert(keyword[3].loc.start.file == "t.pp");
}

void run_lexer_tests() {
    test_text();
    test_directives();
    test_line_directives();
    std::cout << "Lexer tests passed\n";
}
