// Tests for command-line definitions and the driver entry point
#include "TestSupport.h"
#include "lexpp/Driver.h"
#include "lexpp/Predefine.h"

using namespace lexpp;
using lexpp_test::contains;
using lexpp_test::expectError;

static void test_define_lines() {
    assert(defineDirective("A=1") == "#define A 1\n");
    assert(defineDirective("B") == "#define B\n");
    assert(defineDirective("E=") == "#define E\n");
    assert(defineDirective("F(x)=x x") == "#define F(x) x x\n");
    assert(defineDirective("C=x\ny") == "#define C x\\\ny\n");
    assert(defineDirective("D=a=b") == "#define D a=b\n");
}

static void test_predefine() {
    DiagEngine diag(false);
    Environment env = predefine({"X=1", "F(a)=a a", "E", "M=x\ny"}, {}, diag);
    assert(env.size() == 4);
    assert(!env.lookup("X")->isFunction());
    assert(env.lookup("F")->isFunction());
    assert(env.lookup("F")->params == (std::vector<std::string>{"a"}));
    assert(env.lookup("E")->body.empty());
    assert(env.lookup("X")->loc.start.file == kCommandLineSource);
    assert(env.lookup("M")->body.size() == 3);   // x, newline, y

    Environment undone = predefine({"X=1", "Y=2"}, {"X", "NEVER"}, diag);
    assert(!undone.contains("X") && undone.contains("Y"));

    auto redef = expectError([&] { predefine({"X=1", "X=2"}, {}, diag); });
    assert(redef.kind() == ErrorKind::Name);
    assert(redef.loc()->start.file == kCommandLineSource);
    assert(redef.loc()->start.line == 2);

    auto bad = expectError([&] { predefine({"1X=2"}, {}, diag); });
    assert(bad.kind() == ErrorKind::Syntax);
}

static void test_driver() {
    // A missing input is reported without a location
    {
        DriverOptions opts;
        opts.defines = {"GREETING=hello", "TWICE(x)=x x"};
        opts.inputs = {"/nonexistent/lexpp/input.pp"};
        DiagEngine diag(false);
        std::string out;
        assert(!preprocess(opts, diag, out));
        assert(diag.errorCount() == 1);
        auto &d = diag.diagnostics()[0];
        assert(d.level == DiagLevel::Error);
        assert(contains(d.message, "Cannot open input file \"/nonexistent/lexpp/input.pp\""));
        assert(!d.loc);
    }
    // A bad -D is reported, not thrown
    {
        DriverOptions opts;
        opts.defines = {"A=1", "A=2"};
        opts.inputs = {"/nonexistent/lexpp/input.pp"};
        DiagEngine diag(false);
        std::string out;
        assert(!preprocess(opts, diag, out));
        assert(diag.diagnostics()[0].message == "\"A\" is already defined");
    }
}

void run_predefine_tests() {
    test_define_lines();
    test_predefine();
    test_driver();
    std::cout << "Predefine tests passed\n";
}
