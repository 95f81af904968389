#pragma once
#include "lexpp/Token.h"
#include "lexpp/Diagnostic.h"
#include <string>
#include <vector>

namespace lexpp {

// Splits a source file into text tokens and directive lines. Text outside
// directives is kept byte for byte (whitespace included) so that the
// expansion engine can pass it through unchanged. Errors throw a Syntax
// PreprocError.
class Lexer {
public:
    Lexer(std::string source, std::string filename);

    // Lex all tokens (including EOF)
    std::vector<Token> lexAll();

    static bool isDirectiveName(const std::string &word);

private:
    // Character helpers
    char  peek(size_t offset = 0) const;
    char  advance();
    bool  atEnd() const { return pos_ >= src_.size(); }
    bool  atLineStart() const;
    bool  isBlank(char c) const { return c == ' ' || c == '\t' || c == '\r'; }

    // Text mode. `inBody` stops at the end of a #define line.
    void  lexText(std::vector<Token> &out, bool inBody);
    Token lexSpace(bool inBody);
    Token lexIdent();
    Token lexNumberText();
    Token lexString(bool allowNewline);
    Token lexCharOrQuote();
    Token lexOtherText();

    // Directive mode
    bool  startsDirective() const;
    void  lexDirective(std::vector<Token> &out);
    void  lexDefineHeader(std::vector<Token> &out);
    void  lexDirectiveRest(std::vector<Token> &out);
    bool  skipDirectiveBlanks();       // false at end of line
    Token lexExprToken();
    void  endDirective(std::vector<Token> &out);

    [[noreturn]] void fail(const SourcePosition &start, const std::string &msg) const;

    SourcePosition here() const { return {filename_, line_, bol_, static_cast<unsigned>(pos_)}; }
    Token make(TK k, const SourcePosition &start) const {
        return {k, src_.substr(start.offset, pos_ - start.offset), {start, here()}};
    }

    static bool isIdentStart(char c);
    static bool isIdentChar(char c);

    std::string src_;
    std::string filename_;
    size_t      pos_  = 0;
    unsigned    line_ = 1;
    unsigned    bol_  = 0;
};

} // namespace lexpp
