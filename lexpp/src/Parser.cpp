#include "lexpp/Parser.h"
#include "lexpp/Lexer.h"
#include <algorithm>

namespace lexpp {

static SourceLocation span(const SourceLocation &a, const SourceLocation &b) {
    return {a.start, b.end};
}

// ── Constructor ───────────────────────────────────────────────────────────────
Parser::Parser(std::vector<Token> tokens) : toks_(std::move(tokens)) {
    // Ensure there's always an EOF
    if (toks_.empty() || !toks_.back().is(TK::Eof))
        toks_.push_back({TK::Eof, "", {}});
}

NodeList parseSource(std::string source, std::string filename) {
    Lexer lexer(std::move(source), std::move(filename));
    Parser parser(lexer.lexAll());
    return parser.parseFile();
}

// ── Token stream helpers ──────────────────────────────────────────────────────
Token Parser::consume() {
    Token t = toks_[pos_];
    if (pos_ + 1 < toks_.size()) ++pos_;
    return t;
}

Token Parser::expect(TK kind, const char *what) {
    if (cur().is(kind)) return consume();
    fail(cur().loc, std::string("expected ") + what + ", got " + cur().kindName());
}

bool Parser::match(TK k) {
    if (cur().is(k)) { consume(); return true; }
    return false;
}

void Parser::fail(const SourceLocation &loc, const std::string &msg) const {
    throw PreprocError(ErrorKind::Syntax, msg, loc);
}

// =============================================================================
// NODES
// =============================================================================

NodeList Parser::parseFile() {
    NodeList nodes = parseBlock();
    if (!atEnd())
        fail(cur().loc, "#" + cur().text + " without #if");
    return nodes;
}

NodeList Parser::parseBlock() {
    NodeList nodes;
    while (!atEnd()) {
        if (atDirective("elif") || atDirective("else") || atDirective("endif"))
            break;
        nodes.push_back(parseNode());
    }
    return nodes;
}

NodePtr Parser::parseNode() {
    switch (cur().kind) {
    case TK::Directive: return parseDirective();
    case TK::Ident:     return parseIdent();
    default:            return parseTextToken();
    }
}

NodePtr Parser::parseTextToken() {
    switch (cur().kind) {
    case TK::Space: {
        Token t = consume();
        return std::make_shared<TextNode>(true, t.text, t.loc);
    }
    case TK::Text: case TK::StringLit: case TK::CharLit:
    case TK::LParen: case TK::RParen: case TK::Comma: {
        Token t = consume();
        return std::make_shared<TextNode>(false, t.text, t.loc);
    }
    default:
        fail(cur().loc, std::string("unexpected ") + cur().kindName());
    }
}

NodePtr Parser::parseIdent() {
    Token name = consume();
    if (name.text == "__LINE__")
        return std::make_shared<MarkerNode>(NodeKind::CurrentLine, name.loc);
    if (name.text == "__FILE__")
        return std::make_shared<MarkerNode>(NodeKind::CurrentFile, name.loc);

    if (!check(TK::LParen))
        return std::make_shared<IdentNode>(name.text, std::nullopt, name.loc);

    std::vector<NodeList> args = parseCallArgs(name);
    SourceLocation loc = span(name.loc, toks_[pos_ - 1].loc);
    return std::make_shared<IdentNode>(name.text, std::move(args), loc);
}

// Arguments split on commas outside nested parentheses. "()" is zero
// arguments; "( )" is one argument holding a space.
std::vector<NodeList> Parser::parseCallArgs(const Token &name) {
    consume(); // '('
    std::vector<NodeList> args;
    NodeList current;
    bool     sawComma = false;
    int      depth    = 0;

    while (true) {
        switch (cur().kind) {
        case TK::Eof:
        case TK::DirectiveEnd:
            fail(name.loc, "unterminated macro call " + quoteString(name.text));
        case TK::Directive:
            fail(cur().loc, "directive inside the arguments of " + quoteString(name.text));
        case TK::Comma:
            if (depth == 0) {
                consume();
                args.push_back(std::move(current));
                current.clear();
                sawComma = true;
                continue;
            }
            break;
        case TK::LParen:
            ++depth;
            break;
        case TK::RParen:
            if (depth == 0) {
                consume();
                if (sawComma || !current.empty())
                    args.push_back(std::move(current));
                return args;
            }
            --depth;
            break;
        case TK::Ident:
            current.push_back(parseIdent());
            continue;
        default:
            break;
        }
        current.push_back(parseTextToken());
    }
}

// =============================================================================
// DIRECTIVES
// =============================================================================

SourceLocation Parser::endDirective(const Token &dir) {
    if (!check(TK::DirectiveEnd))
        fail(cur().loc, "unexpected " + std::string(cur().kindName()) +
                        " after #" + dir.text);
    Token end = consume();
    return span(dir.loc, end.loc);
}

NodePtr Parser::parseDirective() {
    Token dir = consume();
    const std::string &d = dir.text;

    if (d == "define") return parseDefine(dir);

    if (d == "undef") {
        Token name = expect(TK::Ident, "macro name after #undef");
        SourceLocation loc = endDirective(dir);
        return std::make_shared<UndefNode>(name.text, loc);
    }
    if (d == "include") {
        Token path = expect(TK::StringLit, "quoted file name after #include");
        SourceLocation loc = endDirective(dir);
        return std::make_shared<IncludeNode>(path.strVal, loc);
    }
    if (d == "ifdef" || d == "ifndef") {
        Token name = expect(TK::Ident, ("macro name after #" + d).c_str());
        BoolExprPtr test = std::make_unique<DefinedBool>(name.text, name.loc);
        if (d == "ifndef")
            test = std::make_unique<NotBool>(std::move(test), name.loc);
        return parseConditional(dir, std::move(test));
    }
    if (d == "if") {
        BoolExprPtr test = parseBoolExpr();
        return parseConditional(dir, std::move(test));
    }
    if (d == "error" || d == "warning") {
        Token msg = expect(TK::StringLit, ("quoted message after #" + d).c_str());
        SourceLocation loc = endDirective(dir);
        return std::make_shared<MessageNode>(
            d == "error" ? NodeKind::Error : NodeKind::Warning, msg.strVal, loc);
    }
    if (d == "line") return parseLine(dir);

    // #elif / #else / #endif reach here only without an open #if.
    fail(dir.loc, "#" + d + " without #if");
}

NodePtr Parser::parseDefine(const Token &dir) {
    Token name = expect(TK::Ident, "macro name after #define");

    bool isFunction = false;
    std::vector<std::string> params;
    if (match(TK::LParen)) {
        isFunction = true;
        if (!check(TK::RParen)) {
            while (true) {
                Token p = expect(TK::Ident, "parameter name");
                if (std::find(params.begin(), params.end(), p.text) != params.end())
                    fail(p.loc, "duplicate parameter " + quoteString(p.text) +
                                " in definition of " + quoteString(name.text));
                params.push_back(p.text);
                if (!match(TK::Comma)) break;
            }
        }
        expect(TK::RParen, "')' after parameter list");
    }

    expect(TK::Body, "macro body");
    NodeList body;
    while (!check(TK::DirectiveEnd) && !atEnd())
        body.push_back(parseNode());
    SourceLocation loc = endDirective(dir);

    // Blanks around the body are not part of it.
    auto isSpace = [](const NodePtr &n) {
        return n->kind == NodeKind::Text && static_cast<const TextNode &>(*n).isSpace;
    };
    while (!body.empty() && isSpace(body.back())) body.pop_back();
    auto first = std::find_if_not(body.begin(), body.end(), isSpace);
    body.erase(body.begin(), first);

    if (isFunction)
        return std::make_shared<DefunNode>(name.text, std::move(params), std::move(body), loc);
    return std::make_shared<DefNode>(name.text, std::move(body), loc);
}

NodePtr Parser::parseConditional(const Token &dir, BoolExprPtr test) {
    SourceLocation loc = endDirective(dir);
    NodeList ifTrue = parseBlock();
    NodeList ifFalse;

    if (atEnd())
        fail(loc, "unterminated #" + dir.text);

    Token next = consume();
    if (next.text == "elif") {
        BoolExprPtr elifTest = parseBoolExpr();
        ifFalse.push_back(parseConditional(next, std::move(elifTest)));
    } else if (next.text == "else") {
        endDirective(next);
        ifFalse = parseBlock();
        if (atEnd())
            fail(next.loc, "unterminated #else");
        if (!atDirective("endif"))
            fail(cur().loc, "#" + cur().text + " after #else");
        Token endif = consume();
        endDirective(endif);
    } else {
        endDirective(next); // #endif
    }

    return std::make_shared<CondNode>(std::move(test), std::move(ifTrue),
                                      std::move(ifFalse), loc);
}

NodePtr Parser::parseLine(const Token &dir) {
    Token n = expect(TK::IntLit, "line number");
    std::optional<std::string> file;
    if (check(TK::StringLit)) file = consume().strVal;
    SourceLocation loc = endDirective(dir);
    return std::make_shared<LineNode>(std::move(file), n.intVal, loc);
}

// =============================================================================
// #if EXPRESSIONS
// =============================================================================

bool Parser::isArithBinaryOp(const Token &t) const {
    switch (t.kind) {
    case TK::Plus: case TK::Minus: case TK::Star: case TK::Slash:
    case TK::Percent: case TK::Amp: case TK::Pipe: case TK::Caret:
    case TK::LShift: case TK::RShift:
        return true;
    case TK::Ident:
        return t.text == "mod" || t.text == "land" || t.text == "lor" ||
               t.text == "lxor" || t.text == "lsl" || t.text == "lsr" ||
               t.text == "asr";
    default:
        return false;
    }
}

bool Parser::isComparisonOp(const Token &t) const {
    switch (t.kind) {
    case TK::Eq: case TK::EqEq: case TK::BangEq: case TK::LtGt:
    case TK::Lt: case TK::Gt: case TK::LtEq: case TK::GtEq:
        return true;
    default:
        return false;
    }
}

size_t Parser::matchingParen(size_t open) const {
    int depth = 0;
    for (size_t i = open; i < toks_.size(); ++i) {
        const Token &t = toks_[i];
        if (t.is(TK::DirectiveEnd) || t.is(TK::Eof)) break;
        if (t.is(TK::LParen)) ++depth;
        else if (t.is(TK::RParen) && --depth == 0) return i;
    }
    return std::string::npos;
}

BoolExprPtr Parser::parseBoolExpr() {
    if (check(TK::DirectiveEnd))
        fail(cur().loc, "missing expression");
    return parseOr();
}

BoolExprPtr Parser::parseOr() {
    BoolExprPtr l = parseAnd();
    while (check(TK::PipePipe)) {
        consume();
        BoolExprPtr r = parseAnd();
        SourceLocation loc = span(l->loc, r->loc);
        l = std::make_unique<LogicalBool>(BoolKind::Or, std::move(l), std::move(r), loc);
    }
    return l;
}

BoolExprPtr Parser::parseAnd() {
    BoolExprPtr l = parseNot();
    while (check(TK::AmpAmp)) {
        consume();
        BoolExprPtr r = parseNot();
        SourceLocation loc = span(l->loc, r->loc);
        l = std::make_unique<LogicalBool>(BoolKind::And, std::move(l), std::move(r), loc);
    }
    return l;
}

BoolExprPtr Parser::parseNot() {
    if (check(TK::Bang) || cur().isIdent("not")) {
        Token op = consume();
        BoolExprPtr e = parseNot();
        SourceLocation loc = span(op.loc, e->loc);
        return std::make_unique<NotBool>(std::move(e), loc);
    }
    return parseBoolAtom();
}

BoolExprPtr Parser::parseBoolAtom() {
    if (cur().isIdent("true") || cur().isIdent("false")) {
        Token t = consume();
        return std::make_unique<ConstBool>(t.text == "true", t.loc);
    }

    if (cur().isIdent("defined")) {
        Token kw = consume();
        bool paren = match(TK::LParen);
        Token name = expect(TK::Ident, "macro name after defined");
        SourceLocation loc = span(kw.loc, name.loc);
        if (paren) loc = span(kw.loc, expect(TK::RParen, "')' after defined(NAME").loc);
        return std::make_unique<DefinedBool>(name.text, loc);
    }

    // "(" starts either a nested condition or an arithmetic operand; the
    // token after the matching ")" tells which.
    if (check(TK::LParen)) {
        size_t close = matchingParen(pos_);
        if (close == std::string::npos)
            fail(cur().loc, "unbalanced parentheses");
        const Token &after = toks_[close + 1 < toks_.size() ? close + 1 : close];
        if (!isComparisonOp(after) && !isArithBinaryOp(after)) {
            Token open = consume();
            BoolExprPtr e = parseOr();
            Token shut = expect(TK::RParen, "')'");
            e->loc = span(open.loc, shut.loc);
            return e;
        }
    }

    return parseComparison();
}

// A bare arithmetic expression stands for "<> 0".
BoolExprPtr Parser::parseComparison() {
    ArithExprPtr a = parseArith();

    if (!isComparisonOp(cur())) {
        SourceLocation loc = a->loc;
        auto zero = std::make_unique<IntArith>(0, loc);
        auto eq   = std::make_unique<CompareBool>(BoolKind::Eq, std::move(a), std::move(zero), loc);
        return std::make_unique<NotBool>(std::move(eq), loc);
    }

    Token op = consume();
    ArithExprPtr b = parseArith();
    SourceLocation loc = span(a->loc, b->loc);

    switch (op.kind) {
    case TK::Eq: case TK::EqEq:
        return std::make_unique<CompareBool>(BoolKind::Eq, std::move(a), std::move(b), loc);
    case TK::Lt:
        return std::make_unique<CompareBool>(BoolKind::Lt, std::move(a), std::move(b), loc);
    case TK::Gt:
        return std::make_unique<CompareBool>(BoolKind::Gt, std::move(a), std::move(b), loc);
    case TK::BangEq: case TK::LtGt:
        return std::make_unique<NotBool>(
            std::make_unique<CompareBool>(BoolKind::Eq, std::move(a), std::move(b), loc), loc);
    case TK::LtEq:
        return std::make_unique<NotBool>(
            std::make_unique<CompareBool>(BoolKind::Gt, std::move(a), std::move(b), loc), loc);
    default: // GtEq
        return std::make_unique<NotBool>(
            std::make_unique<CompareBool>(BoolKind::Lt, std::move(a), std::move(b), loc), loc);
    }
}

// additive: + -
ArithExprPtr Parser::parseArith() {
    ArithExprPtr l = parseMul();
    while (check(TK::Plus) || check(TK::Minus)) {
        ArithKind k = consume().is(TK::Plus) ? ArithKind::Add : ArithKind::Sub;
        ArithExprPtr r = parseMul();
        SourceLocation loc = span(l->loc, r->loc);
        l = std::make_unique<BinaryArith>(k, std::move(l), std::move(r), loc);
    }
    return l;
}

// multiplicative: * / mod % land & lor | lxor ^
ArithExprPtr Parser::parseMul() {
    ArithExprPtr l = parseShift();
    while (true) {
        const Token &t = cur();
        ArithKind k;
        if      (t.is(TK::Star))                          k = ArithKind::Mul;
        else if (t.is(TK::Slash))                         k = ArithKind::Div;
        else if (t.is(TK::Percent) || t.isIdent("mod"))   k = ArithKind::Mod;
        else if (t.is(TK::Amp)     || t.isIdent("land"))  k = ArithKind::Land;
        else if (t.is(TK::Pipe)    || t.isIdent("lor"))   k = ArithKind::Lor;
        else if (t.is(TK::Caret)   || t.isIdent("lxor"))  k = ArithKind::Lxor;
        else break;
        consume();
        ArithExprPtr r = parseShift();
        SourceLocation loc = span(l->loc, r->loc);
        l = std::make_unique<BinaryArith>(k, std::move(l), std::move(r), loc);
    }
    return l;
}

// shifts, right-associative: lsl << lsr asr >>
ArithExprPtr Parser::parseShift() {
    ArithExprPtr l = parseUnary();
    const Token &t = cur();
    ArithKind k;
    if      (t.is(TK::LShift) || t.isIdent("lsl")) k = ArithKind::Lsl;
    else if (t.isIdent("lsr"))                      k = ArithKind::Lsr;
    else if (t.is(TK::RShift) || t.isIdent("asr")) k = ArithKind::Asr;
    else return l;
    consume();
    ArithExprPtr r = parseShift();
    SourceLocation loc = span(l->loc, r->loc);
    return std::make_unique<BinaryArith>(k, std::move(l), std::move(r), loc);
}

ArithExprPtr Parser::parseUnary() {
    if (check(TK::Minus)) {
        Token op = consume();
        ArithExprPtr e = parseUnary();
        SourceLocation loc = span(op.loc, e->loc);
        return std::make_unique<UnaryArith>(ArithKind::Neg, std::move(e), loc);
    }
    if (check(TK::Tilde) || cur().isIdent("lnot")) {
        Token op = consume();
        ArithExprPtr e = parseUnary();
        SourceLocation loc = span(op.loc, e->loc);
        return std::make_unique<UnaryArith>(ArithKind::Lnot, std::move(e), loc);
    }
    if (check(TK::Plus)) {
        consume();
        return parseUnary();
    }
    return parsePrimary();
}

ArithExprPtr Parser::parsePrimary() {
    if (check(TK::IntLit)) {
        Token t = consume();
        return std::make_unique<IntArith>(t.intVal, t.loc);
    }
    if (check(TK::Ident)) {
        Token t = consume();
        return std::make_unique<IdentArith>(t.text, t.loc);
    }
    if (check(TK::LParen)) {
        Token open = consume();
        ArithExprPtr e = parseArith();
        Token shut = expect(TK::RParen, "')'");
        e->loc = span(open.loc, shut.loc);
        return e;
    }
    fail(cur().loc, std::string("expected an arithmetic expression, got ") + cur().kindName());
}

} // namespace lexpp
