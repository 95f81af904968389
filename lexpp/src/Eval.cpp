#include "lexpp/Eval.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <vector>

namespace lexpp {

// =============================================================================
// Literal parsing
// =============================================================================

static bool isSpaceChar(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string stripSpace(const std::string &s) {
    size_t b = 0;
    while (b < s.size() && isSpaceChar(s[b])) ++b;
    size_t e = s.size();
    while (e > b && isSpaceChar(s[e - 1])) --e;
    return s.substr(b, e - b);
}

static int digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return 99;
}

std::optional<int64_t> parseInt64(const std::string &s) {
    size_t p   = 0;
    bool   neg = false;
    if (p < s.size() && (s[p] == '-' || s[p] == '+')) {
        neg = (s[p] == '-');
        ++p;
    }

    unsigned base       = 10;
    bool     isUnsigned = false;
    if (p + 1 < s.size() && s[p] == '0') {
        switch (s[p + 1]) {
        case 'x': case 'X': base = 16; p += 2; break;
        case 'o': case 'O': base = 8;  p += 2; break;
        case 'b': case 'B': base = 2;  p += 2; break;
        case 'u': case 'U': isUnsigned = true; p += 2; break;
        default: break;
        }
    }

    // At least one digit, and '_' only after the first one.
    if (p >= s.size() || digitValue(s[p]) >= static_cast<int>(base))
        return std::nullopt;

    const uint64_t limit = (base == 10 && !isUnsigned)
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + (neg ? 1 : 0)
        : std::numeric_limits<uint64_t>::max();

    uint64_t acc = 0;
    for (; p < s.size(); ++p) {
        if (s[p] == '_') continue;
        int d = digitValue(s[p]);
        if (d >= static_cast<int>(base)) return std::nullopt;
        if (acc > (limit - static_cast<uint64_t>(d)) / base) return std::nullopt;
        acc = acc * base + static_cast<uint64_t>(d);
    }

    if (neg) acc = 0 - acc;
    return static_cast<int64_t>(acc);
}

// =============================================================================
// Arithmetic
// =============================================================================

namespace {

// Two's-complement helpers; the unsigned detour keeps overflow defined.
int64_t wrap(uint64_t v)               { return static_cast<int64_t>(v); }
uint64_t bits(int64_t v)               { return static_cast<uint64_t>(v); }

int64_t shiftLeft(int64_t n, int64_t shift) {
    if (shift >= 64 || shift <= -64) return 0;
    return wrap(bits(n) << (bits(shift) & 63));
}

int64_t shiftRightLogical(int64_t n, int64_t shift) {
    if (shift >= 64 || shift <= -64) return 0;
    return wrap(bits(n) >> (bits(shift) & 63));
}

int64_t shiftRightArith(int64_t n, int64_t shift) {
    if (shift >= 64 || shift <= -64) return 0;
    unsigned k = static_cast<unsigned>(bits(shift) & 63);
    return n < 0 ? ~(~n >> k) : (n >> k);
}

std::string quoted(const std::string &name) { return quoteString(name); }

class ArithEvaluator {
public:
    explicit ArithEvaluator(const Environment &env) : env_(env) {}

    int64_t eval(const ArithExpr &e) {
        switch (e.kind) {
        case ArithKind::Int:
            return static_cast<const IntArith &>(e).value;
        case ArithKind::Ident: {
            auto &id = static_cast<const IdentArith &>(e);
            return evalIdent(id.name, id.loc);
        }
        case ArithKind::Neg:
            return wrap(0 - bits(eval(*static_cast<const UnaryArith &>(e).operand)));
        case ArithKind::Lnot:
            return ~eval(*static_cast<const UnaryArith &>(e).operand);
        default:
            break;
        }

        auto &bin = static_cast<const BinaryArith &>(e);
        int64_t a = eval(*bin.left);
        int64_t b = eval(*bin.right);
        switch (e.kind) {
        case ArithKind::Add:  return wrap(bits(a) + bits(b));
        case ArithKind::Sub:  return wrap(bits(a) - bits(b));
        case ArithKind::Mul:  return wrap(bits(a) * bits(b));
        case ArithKind::Div:
            if (b == 0) throw PreprocError(ErrorKind::Eval, "Division by zero", e.loc);
            if (b == -1) return wrap(0 - bits(a));
            return a / b;
        case ArithKind::Mod:
            if (b == 0) throw PreprocError(ErrorKind::Eval, "Division by zero", e.loc);
            if (b == -1) return 0;
            return a % b;
        case ArithKind::Lsl:  return shiftLeft(a, b);
        case ArithKind::Lsr:  return shiftRightLogical(a, b);
        case ArithKind::Asr:  return shiftRightArith(a, b);
        case ArithKind::Land: return a & b;
        case ArithKind::Lor:  return a | b;
        case ArithKind::Lxor: return a ^ b;
        default:
            break;
        }
        throw PreprocError(ErrorKind::Eval,
                           std::string("unexpected arithmetic node ") + kindName(e.kind),
                           e.loc);
    }

private:
    int64_t evalIdent(const std::string &name, const SourceLocation &loc) {
        MacroDefPtr def = env_.lookup(name);
        if (!def)
            throw PreprocError(ErrorKind::Name,
                               "Undefined identifier " + quoted(name), loc);
        if (def->isFunction())
            throw PreprocError(ErrorKind::Eval,
                               quoted(name) + " expects arguments", loc);

        // Anything that goes wrong past the lookup is reported against `name`.
        try {
            return evalBody(name, *def, loc);
        } catch (const PreprocError &inner) {
            throw PreprocError(ErrorKind::Eval,
                               "Identifier " + quoted(name) +
                               " does not expand to an int:\n" + inner.what(),
                               loc);
        }
    }

    int64_t evalBody(const std::string &name, const MacroDef &def,
                     const SourceLocation &loc) {
        NodeList nonSpace;
        for (auto &n : def.body) {
            if (n->kind == NodeKind::Text && static_cast<const TextNode &>(*n).isSpace)
                continue;
            nonSpace.push_back(n);
        }

        // A body that is one plain identifier is an alias: follow it.
        if (nonSpace.size() == 1 && nonSpace[0]->kind == NodeKind::Ident) {
            auto &alias = static_cast<const IdentNode &>(*nonSpace[0]);
            if (!alias.args) {
                if (std::find(resolving_.begin(), resolving_.end(), name) != resolving_.end())
                    throw PreprocError(ErrorKind::Eval,
                                       "Identifier " + quoted(name) +
                                       " is bound to a cyclic alias chain", loc);
                resolving_.push_back(name);
                int64_t v = evalIdent(alias.name, alias.loc);
                resolving_.pop_back();
                return v;
            }
        }

        std::string text;
        for (auto &n : def.body) {
            if (n->kind != NodeKind::Text)
                throw PreprocError(ErrorKind::Eval,
                                   "Identifier " + quoted(name) +
                                   " is not bound to a constant", loc);
            text += static_cast<const TextNode &>(*n).text;
        }

        auto value = parseInt64(stripSpace(text));
        if (!value)
            throw PreprocError(ErrorKind::Eval,
                               "Identifier " + quoted(name) +
                               " is not bound to an int literal", loc);
        return *value;
    }

    const Environment       &env_;
    std::vector<std::string> resolving_;   // alias chain being followed
};

} // namespace

int64_t evalInt(const Environment &env, const ArithExpr &e) {
    ArithEvaluator ev(env);
    return ev.eval(e);
}

// =============================================================================
// Boolean
// =============================================================================

bool evalBool(const Environment &env, const BoolExpr &e) {
    switch (e.kind) {
    case BoolKind::True:  return true;
    case BoolKind::False: return false;
    case BoolKind::Defined:
        return env.contains(static_cast<const DefinedBool &>(e).name);
    case BoolKind::Not:
        return !evalBool(env, *static_cast<const NotBool &>(e).operand);
    case BoolKind::And: {
        auto &l = static_cast<const LogicalBool &>(e);
        return evalBool(env, *l.left) && evalBool(env, *l.right);
    }
    case BoolKind::Or: {
        auto &l = static_cast<const LogicalBool &>(e);
        return evalBool(env, *l.left) || evalBool(env, *l.right);
    }
    case BoolKind::Eq: {
        auto &c = static_cast<const CompareBool &>(e);
        return evalInt(env, *c.left) == evalInt(env, *c.right);
    }
    case BoolKind::Lt: {
        auto &c = static_cast<const CompareBool &>(e);
        return evalInt(env, *c.left) < evalInt(env, *c.right);
    }
    case BoolKind::Gt: {
        auto &c = static_cast<const CompareBool &>(e);
        return evalInt(env, *c.left) > evalInt(env, *c.right);
    }
    }
    return false;
}

} // namespace lexpp
