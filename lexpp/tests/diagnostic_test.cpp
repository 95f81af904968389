// Tests for locations, quoting and the diagnostic engine
#include "TestSupport.h"

using namespace lexpp;

static SourceLocation at(const char *file, unsigned line, unsigned bol,
                         unsigned start, unsigned end) {
    return {{file, line, bol, start}, {file, line, bol, end}};
}

void run_diagnostic_tests() {
    // Filenames are quoted with escapes
    assert(quoteString("plain.pp") == "\"plain.pp\"");
    assert(quoteString("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(quoteString("\t\r\b") == "\"\\t\\r\\b\"");
    assert(quoteString(std::string("\x01", 1)) == "\"\\001\"");
    assert(quoteString("\xc3\xa9") == "\"\\195\\169\"");

    // Characters are counted from the start line's beginning
    auto loc = at("f.pp", 3, 20, 24, 30);
    assert(loc.str() == "File \"f.pp\", line 3, characters 4-10");

    // Marker text, with and without the filename
    SourcePosition pos("f.pp", 7, 100, 103);
    assert(lineDirective(pos, true)  == "# 7 \"f.pp\"\n   ");
    assert(lineDirective(pos, false) == "# 7\n   ");

    // Error text
    PreprocError located(ErrorKind::User, "boom", loc);
    assert(std::string(located.what()) ==
           "File \"f.pp\", line 3, characters 4-10\nError: boom");
    assert(located.kind() == ErrorKind::User);
    assert(located.message() == "boom");
    assert(located.loc().has_value());

    PreprocError bare(ErrorKind::Io, "Cannot read standard input: gone");
    assert(std::string(bare.what()) == "Error: Cannot read standard input: gone");
    assert(!bare.loc());

    assert(std::string(errorKindName(ErrorKind::Cycle)) == "CycleError");
    assert(std::string(errorKindName(ErrorKind::Arity)) == "ArityError");

    // The engine records without changing anything else
    DiagEngine diag(false);
    diag.warn(loc, "careful");
    assert(diag.warningCount() == 1);
    assert(!diag.hasErrors());
    diag.report(located);
    assert(diag.errorCount() == 1);
    assert(diag.diagnostics().size() == 2);
    assert(diag.diagnostics()[0].level == DiagLevel::Warning);
    assert(diag.diagnostics()[0].message == "careful");
    assert(diag.diagnostics()[1].level == DiagLevel::Error);
    assert(diag.diagnostics()[1].loc->start.line == 3);

    std::cout << "Diagnostic tests passed\n";
}
