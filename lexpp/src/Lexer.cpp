#include "lexpp/Lexer.h"
#include "lexpp/Eval.h"
#include <cctype>
#include <unordered_set>

namespace lexpp {

// ── Directive table ───────────────────────────────────────────────────────────
bool Lexer::isDirectiveName(const std::string &word) {
    static const std::unordered_set<std::string> names = {
        "define", "undef", "include",
        "if", "ifdef", "ifndef", "elif", "else", "endif",
        "error", "warning", "line",
    };
    return names.count(word) > 0;
}

bool Lexer::isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\'';
}

// ── Constructor ───────────────────────────────────────────────────────────────
Lexer::Lexer(std::string source, std::string filename)
    : src_(std::move(source)), filename_(std::move(filename)) {}

// ── Character helpers ─────────────────────────────────────────────────────────
char Lexer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    return (idx < src_.size()) ? src_[idx] : '\0';
}

char Lexer::advance() {
    char c = src_[pos_++];
    if (c == '\n') { ++line_; bol_ = static_cast<unsigned>(pos_); }
    return c;
}

bool Lexer::atLineStart() const {
    for (size_t i = bol_; i < pos_; ++i)
        if (!isBlank(src_[i])) return false;
    return true;
}

void Lexer::fail(const SourcePosition &start, const std::string &msg) const {
    throw PreprocError(ErrorKind::Syntax, msg, SourceLocation{start, here()});
}

// =============================================================================
// Top level
// =============================================================================

std::vector<Token> Lexer::lexAll() {
    std::vector<Token> out;
    while (!atEnd()) {
        if (atLineStart() && startsDirective()) {
            lexDirective(out);
            continue;
        }
        lexText(out, false);
    }
    out.push_back({TK::Eof, "", {here(), here()}});
    return out;
}

// =============================================================================
// Text mode
// =============================================================================

void Lexer::lexText(std::vector<Token> &out, bool inBody) {
    char c = peek();
    if (isBlank(c) || c == '\n' ||
        (inBody && c == '\\' && peek(1) == '\n')) {
        out.push_back(lexSpace(inBody));
        return;
    }
    if (isIdentStart(c)) { out.push_back(lexIdent()); return; }
    if (std::isdigit(static_cast<unsigned char>(c))) { out.push_back(lexNumberText()); return; }

    SourcePosition start = here();
    switch (c) {
    case '"':  out.push_back(lexString(!inBody)); return;
    case '\'': out.push_back(lexCharOrQuote());   return;
    case '(':  advance(); out.push_back(make(TK::LParen, start)); return;
    case ')':  advance(); out.push_back(make(TK::RParen, start)); return;
    case ',':  advance(); out.push_back(make(TK::Comma,  start)); return;
    default:   out.push_back(lexOtherText());     return;
    }
}

// Outside a body a space token ends right after a newline, so that the next
// line can be checked for a directive. Inside a body a backslash-newline is
// kept as a newline and a bare newline ends the body.
Token Lexer::lexSpace(bool inBody) {
    SourcePosition start = here();
    std::string text;
    while (!atEnd()) {
        char c = peek();
        if (isBlank(c)) { text += advance(); continue; }
        if (inBody && c == '\\' && peek(1) == '\n') {
            advance(); advance();
            text += '\n';
            continue;
        }
        if (c == '\n' && !inBody) { text += advance(); break; }
        break;
    }
    Token t = make(TK::Space, start);
    t.text = std::move(text);
    return t;
}

Token Lexer::lexIdent() {
    SourcePosition start = here();
    advance();
    while (!atEnd() && isIdentChar(peek())) advance();
    return make(TK::Ident, start);
}

Token Lexer::lexNumberText() {
    SourcePosition start = here();
    while (!atEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_'))
        advance();
    return make(TK::Text, start);
}

Token Lexer::lexString(bool allowNewline) {
    SourcePosition start = here();
    advance(); // opening quote
    std::string value;
    while (true) {
        if (atEnd() || (!allowNewline && peek() == '\n'))
            fail(start, "unterminated string literal");
        char c = advance();
        if (c == '"') break;
        if (c != '\\') { value += c; continue; }
        if (atEnd()) fail(start, "unterminated string literal");
        char e = advance();
        switch (e) {
        case 'n':  value += '\n'; break;
        case 't':  value += '\t'; break;
        case 'r':  value += '\r'; break;
        case 'b':  value += '\b'; break;
        case '\n':
            // Escaped newline: skip the next line's leading blanks.
            while (!atEnd() && (peek() == ' ' || peek() == '\t')) advance();
            break;
        default:
            if (std::isdigit(static_cast<unsigned char>(e)) &&
                std::isdigit(static_cast<unsigned char>(peek())) &&
                std::isdigit(static_cast<unsigned char>(peek(1)))) {
                int code = (e - '0') * 100 + (advance() - '0') * 10;
                code += advance() - '0';
                value += static_cast<char>(code & 0xff);
            } else {
                value += e;
            }
        }
    }
    Token t = make(TK::StringLit, start);
    t.strVal = std::move(value);
    return t;
}

// 'x' and '\n' style literals are opaque; any other quote is plain text
// (type variables, primes).
Token Lexer::lexCharOrQuote() {
    SourcePosition start = here();
    if (peek(1) == '\\' && peek(2) != '\0' && peek(2) != '\n') {
        size_t i = 3;
        while (pos_ + i < src_.size() && i < 6 && src_[pos_ + i] != '\'' &&
               src_[pos_ + i] != '\n')
            ++i;
        if (peek(i) == '\'') {
            for (size_t k = 0; k <= i; ++k) advance();
            return make(TK::CharLit, start);
        }
    } else if (peek(1) != '\0' && peek(1) != '\n' && peek(2) == '\'') {
        advance(); advance(); advance();
        return make(TK::CharLit, start);
    }
    advance();
    return make(TK::Text, start);
}

Token Lexer::lexOtherText() {
    SourcePosition start = here();
    advance();
    while (!atEnd()) {
        char c = peek();
        if (isBlank(c) || c == '\n' || c == '\\' || isIdentStart(c) ||
            std::isdigit(static_cast<unsigned char>(c)) ||
            c == '"' || c == '\'' || c == '(' || c == ')' || c == ',')
            break;
        advance();
    }
    return make(TK::Text, start);
}

// =============================================================================
// Directive mode
// =============================================================================

// Called at a line start: blanks, '#', blanks, then a directive name or a
// line number.
bool Lexer::startsDirective() const {
    size_t i = pos_;
    while (i < src_.size() && isBlank(src_[i])) ++i;
    if (i >= src_.size() || src_[i] != '#') return false;
    ++i;
    while (i < src_.size() && isBlank(src_[i])) ++i;
    if (i < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i])))
        return true;
    size_t j = i;
    while (j < src_.size() && std::isalpha(static_cast<unsigned char>(src_[j]))) ++j;
    return isDirectiveName(src_.substr(i, j - i));
}

void Lexer::lexDirective(std::vector<Token> &out) {
    while (isBlank(peek())) advance();
    SourcePosition start = here();
    advance(); // '#'
    while (isBlank(peek())) advance();

    std::string name;
    if (std::isdigit(static_cast<unsigned char>(peek()))) {
        name = "line";
    } else {
        while (std::isalpha(static_cast<unsigned char>(peek()))) name += advance();
    }
    Token dir = make(TK::Directive, start);
    dir.text  = name;
    out.push_back(dir);

    if (name == "define") {
        lexDefineHeader(out);
        return;
    }

    size_t first = out.size();
    lexDirectiveRest(out);

    if (name != "line") return;

    // The line after "# N [file]" is line N of that file.
    if (first < out.size() && out[first].is(TK::IntLit)) {
        int64_t n = out[first].intVal;
        if (n < 0 || n > 0x7fffffff)
            fail(out[first].loc.start, "line number out of range");
        line_ = static_cast<unsigned>(n);
        if (first + 1 < out.size() && out[first + 1].is(TK::StringLit))
            filename_ = out[first + 1].strVal;
    }
}

// NAME, then "(params)" only when '(' touches the name, then the body.
void Lexer::lexDefineHeader(std::vector<Token> &out) {
    if (!skipDirectiveBlanks()) { endDirective(out); return; }
    if (!isIdentStart(peek())) { lexDirectiveRest(out); return; }

    out.push_back(lexIdent());
    if (peek() == '(') {
        SourcePosition start = here();
        advance();
        out.push_back(make(TK::LParen, start));
        while (true) {
            if (!skipDirectiveBlanks()) fail(start, "unterminated parameter list");
            Token t = lexExprToken();
            bool closing = t.is(TK::RParen);
            out.push_back(std::move(t));
            if (closing) break;
        }
    }

    SourcePosition bodyStart = here();
    out.push_back(make(TK::Body, bodyStart));
    while (!atEnd() && peek() != '\n')
        lexText(out, true);
    endDirective(out);
}

void Lexer::lexDirectiveRest(std::vector<Token> &out) {
    while (skipDirectiveBlanks())
        out.push_back(lexExprToken());
    endDirective(out);
}

bool Lexer::skipDirectiveBlanks() {
    while (!atEnd()) {
        char c = peek();
        if (isBlank(c)) { advance(); continue; }
        if (c == '\\' && peek(1) == '\n') { advance(); advance(); continue; }
        break;
    }
    return !atEnd() && peek() != '\n';
}

void Lexer::endDirective(std::vector<Token> &out) {
    SourcePosition start = here();
    if (!atEnd()) advance(); // '\n'
    out.push_back({TK::DirectiveEnd, "", {start, start}});
}

Token Lexer::lexExprToken() {
    SourcePosition start = here();
    char c = peek();

    if (isIdentStart(c)) return lexIdent();
    if (c == '"') return lexString(false);

    if (std::isdigit(static_cast<unsigned char>(c))) {
        Token t = lexNumberText();
        auto v = parseInt64(t.text);
        if (!v) fail(start, "invalid integer literal " + t.text);
        t.kind   = TK::IntLit;
        t.intVal = *v;
        return t;
    }

    auto two = [&](char a, char b) { return c == a && peek(1) == b; };
    auto op  = [&](TK k, int n) {
        for (int i = 0; i < n; ++i) advance();
        return make(k, start);
    };

    if (two('&', '&')) return op(TK::AmpAmp,   2);
    if (two('|', '|')) return op(TK::PipePipe, 2);
    if (two('=', '=')) return op(TK::EqEq,     2);
    if (two('!', '=')) return op(TK::BangEq,   2);
    if (two('<', '>')) return op(TK::LtGt,     2);
    if (two('<', '=')) return op(TK::LtEq,     2);
    if (two('>', '=')) return op(TK::GtEq,     2);
    if (two('<', '<')) return op(TK::LShift,   2);
    if (two('>', '>')) return op(TK::RShift,   2);

    switch (c) {
    case '+': return op(TK::Plus,    1);
    case '-': return op(TK::Minus,   1);
    case '*': return op(TK::Star,    1);
    case '/': return op(TK::Slash,   1);
    case '%': return op(TK::Percent, 1);
    case '&': return op(TK::Amp,     1);
    case '|': return op(TK::Pipe,    1);
    case '^': return op(TK::Caret,   1);
    case '~': return op(TK::Tilde,   1);
    case '!': return op(TK::Bang,    1);
    case '=': return op(TK::Eq,      1);
    case '<': return op(TK::Lt,      1);
    case '>': return op(TK::Gt,      1);
    case '(': return op(TK::LParen,  1);
    case ')': return op(TK::RParen,  1);
    case ',': return op(TK::Comma,   1);
    default:  break;
    }
    advance();
    fail(start, std::string("unexpected character '") + c + "' in directive");
}

// ── Token names ───────────────────────────────────────────────────────────────
const char *Token::kindName() const {
    switch (kind) {
    case TK::Ident:        return "identifier";
    case TK::Space:        return "whitespace";
    case TK::Text:         return "text";
    case TK::StringLit:    return "string literal";
    case TK::CharLit:      return "character literal";
    case TK::LParen:       return "'('";
    case TK::RParen:       return "')'";
    case TK::Comma:        return "','";
    case TK::Directive:    return "directive";
    case TK::Body:         return "macro body";
    case TK::DirectiveEnd: return "end of line";
    case TK::IntLit:       return "integer literal";
    case TK::Plus:         return "'+'";
    case TK::Minus:        return "'-'";
    case TK::Star:         return "'*'";
    case TK::Slash:        return "'/'";
    case TK::Percent:      return "'%'";
    case TK::Amp:          return "'&'";
    case TK::Pipe:         return "'|'";
    case TK::Caret:        return "'^'";
    case TK::Tilde:        return "'~'";
    case TK::LShift:       return "'<<'";
    case TK::RShift:       return "'>>'";
    case TK::AmpAmp:       return "'&&'";
    case TK::PipePipe:     return "'||'";
    case TK::Bang:         return "'!'";
    case TK::Eq:           return "'='";
    case TK::EqEq:         return "'=='";
    case TK::BangEq:       return "'!='";
    case TK::LtGt:         return "'<>'";
    case TK::Lt:           return "'<'";
    case TK::Gt:           return "'>'";
    case TK::LtEq:         return "'<='";
    case TK::GtEq:         return "'>='";
    case TK::Eof:          return "end of file";
    case TK::Invalid:      return "invalid token";
    }
    return "?";
}

} // namespace lexpp
