#pragma once
#include "lexpp/AST.h"
#include "lexpp/Environment.h"
#include <cstdint>
#include <optional>
#include <string>

namespace lexpp {

// =============================================================================
// Conditional expression evaluation
// =============================================================================
// Identifiers inside arithmetic must be bound to an object-macro whose body
// is either a single identifier (followed as an alias) or an integer literal.
// Function-macros are never expanded here. All failures throw PreprocError.

int64_t evalInt(const Environment &env, const ArithExpr &e);

// And/Or evaluate left to right and stop at the first operand that decides
// the result.
bool evalBool(const Environment &env, const BoolExpr &e);

// Integer literal syntax: [+-] then decimal, 0x, 0o, 0b or 0u digits, with
// '_' separators after the first digit. Decimal must fit a signed 64-bit
// value; prefixed forms accept up to 2^64-1 and wrap to two's complement.
// Surrounding whitespace is not accepted, callers strip it.
std::optional<int64_t> parseInt64(const std::string &s);

// Strips ' ', '\t', '\n' and '\r' from both ends.
std::string stripSpace(const std::string &s);

} // namespace lexpp
