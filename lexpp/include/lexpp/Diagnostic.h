#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lexpp {

// ── Source positions ──────────────────────────────────────────────────────────
// `offset` is the absolute character offset in the file, `bol` the offset of
// the first character of `line`.
struct SourcePosition {
    std::string file;
    unsigned    line   = 1;
    unsigned    bol    = 0;
    unsigned    offset = 0;

    SourcePosition() = default;
    SourcePosition(std::string f, unsigned l, unsigned b, unsigned o)
        : file(std::move(f)), line(l), bol(b), offset(o) {}

    unsigned column() const { return offset - bol; }
};

struct SourceLocation {
    SourcePosition start;
    SourcePosition end;

    SourceLocation() = default;
    SourceLocation(SourcePosition s, SourcePosition e)
        : start(std::move(s)), end(std::move(e)) {}

    // File "<name>", line <n>, characters <c1>-<c2>
    std::string str() const;
};

// Quote a string the way diagnostics and line markers print filenames.
std::string quoteString(const std::string &s);

// "# <line> \"<file>\"\n<indent>" or "# <line>\n<indent>" when withFile is false.
std::string lineDirective(const SourcePosition &pos, bool withFile);

// ── Fatal errors ──────────────────────────────────────────────────────────────
enum class ErrorKind { Syntax, Name, Arity, Eval, Cycle, User, Io };

const char *errorKindName(ErrorKind k);

class PreprocError : public std::runtime_error {
public:
    PreprocError(ErrorKind kind, std::string message,
                 std::optional<SourceLocation> loc = std::nullopt);

    ErrorKind                            kind()    const { return kind_; }
    const std::string                   &message() const { return message_; }
    const std::optional<SourceLocation> &loc()     const { return loc_; }

private:
    static std::string format(const std::string &message,
                              const std::optional<SourceLocation> &loc);

    ErrorKind                     kind_;
    std::string                   message_;
    std::optional<SourceLocation> loc_;
};

// ── Diagnostic side channel ───────────────────────────────────────────────────
enum class DiagLevel { Warning, Error };

struct Diagnostic {
    DiagLevel                     level;
    std::optional<SourceLocation> loc;
    std::string                   message;
};

class DiagEngine {
public:
    explicit DiagEngine(bool echo = true) : echo_(echo) {}

    // Non-fatal: printed and recorded, never alters control flow.
    void warn(const SourceLocation &l, std::string msg);

    // Print and record a fatal error caught by the driver.
    void report(const PreprocError &e);

    bool hasErrors()    const { return errorCount_ > 0; }
    int  errorCount()   const { return errorCount_; }
    int  warningCount() const { return warningCount_; }

    const std::vector<Diagnostic> &diagnostics() const { return diags_; }

private:
    void emit(const std::string &text);

    bool                    echo_;
    int                     errorCount_   = 0;
    int                     warningCount_ = 0;
    std::vector<Diagnostic> diags_;
};

} // namespace lexpp
