#include "lexpp/Diagnostic.h"
#include <cstdio>

namespace lexpp {

// =============================================================================
// Locations
// =============================================================================

std::string quoteString(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\t': out += "\\t";  break;
        case '\r': out += "\\r";  break;
        case '\b': out += "\\b";  break;
        default:
            if (c >= 0x20 && c < 0x7f) {
                out += static_cast<char>(c);
            } else {
                char buf[5];
                snprintf(buf, sizeof(buf), "\\%03u", static_cast<unsigned>(c));
                out += buf;
            }
        }
    }
    out += '"';
    return out;
}

std::string SourceLocation::str() const {
    // Both character offsets are relative to the start line, so a location
    // spanning several lines reports an end past the first line's length.
    return "File " + quoteString(start.file) +
           ", line " + std::to_string(start.line) +
           ", characters " + std::to_string(start.offset - start.bol) +
           "-" + std::to_string(end.offset - start.bol);
}

std::string lineDirective(const SourcePosition &pos, bool withFile) {
    std::string out = "# " + std::to_string(pos.line);
    if (withFile) out += " " + quoteString(pos.file);
    out += '\n';
    out.append(pos.column(), ' ');
    return out;
}

// =============================================================================
// PreprocError
// =============================================================================

const char *errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::Syntax: return "SyntaxError";
    case ErrorKind::Name:   return "NameError";
    case ErrorKind::Arity:  return "ArityError";
    case ErrorKind::Eval:   return "EvalError";
    case ErrorKind::Cycle:  return "CycleError";
    case ErrorKind::User:   return "UserError";
    case ErrorKind::Io:     return "IoError";
    }
    return "Error";
}

PreprocError::PreprocError(ErrorKind kind, std::string message,
                           std::optional<SourceLocation> loc)
    : std::runtime_error(format(message, loc)),
      kind_(kind), message_(std::move(message)), loc_(std::move(loc)) {}

std::string PreprocError::format(const std::string &message,
                                 const std::optional<SourceLocation> &loc) {
    if (!loc) return "Error: " + message;
    return loc->str() + "\nError: " + message;
}

// =============================================================================
// DiagEngine
// =============================================================================

void DiagEngine::emit(const std::string &text) {
    if (!echo_) return;
    fprintf(stderr, "%s\n", text.c_str());
    fflush(stderr);
}

void DiagEngine::warn(const SourceLocation &l, std::string msg) {
    emit(l.str() + "\nWarning: " + msg);
    ++warningCount_;
    diags_.push_back({DiagLevel::Warning, l, std::move(msg)});
}

void DiagEngine::report(const PreprocError &e) {
    emit(e.what());
    ++errorCount_;
    diags_.push_back({DiagLevel::Error, e.loc(), e.message()});
}

} // namespace lexpp
