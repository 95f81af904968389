// Tests for the parser
#include "TestSupport.h"

using namespace lexpp;
using lexpp_test::contains;
using lexpp_test::expectError;

static NodeList parse(const std::string &src) { return parseSource(src, "t.pp"); }

template <class T>
static const T &as(const NodePtr &n) { return static_cast<const T &>(*n); }

static std::string syntaxError(const std::string &src) {
    auto e = expectError([&] { parse(src); });
    assert(e.kind() == ErrorKind::Syntax);
    return e.message();
}

static void test_calls() {
    auto nodes = parse("f(a,(b,c),)");
    assert(nodes.size() == 1);
    auto &call = as<IdentNode>(nodes[0]);
    assert(call.name == "f" && call.args);
    assert(call.args->size() == 3);
    assert((*call.args)[0].size() == 1);
    assert((*call.args)[1].size() == 5);          // ( b , c )
    assert((*call.args)[2].empty());
    assert(call.loc.start.offset == 0 && call.loc.end.offset == 11);

    auto none = parse("f()");
    assert(as<IdentNode>(none[0]).args->empty());

    auto blank = parse("f( )");
    assert(as<IdentNode>(blank[0]).args->size() == 1);

    auto nested = parse("f(g(x), y)");
    auto &outer = as<IdentNode>(nested[0]);
    assert(outer.args->size() == 2);
    auto &inner = as<IdentNode>((*outer.args)[0][0]);
    assert(inner.name == "g" && inner.args->size() == 1);

    // A space before '(' means no call
    auto spaced = parse("f (x)");
    assert(!as<IdentNode>(spaced[0]).args);
    assert(spaced.size() == 5);

    auto markers = parse("__LINE__ __FILE__");
    assert(markers[0]->kind == NodeKind::CurrentLine);
    assert(markers[2]->kind == NodeKind::CurrentFile);

    assert(contains(syntaxError("f(a\n"), "unterminated macro call \"f\""));
    assert(contains(syntaxError("f(a\n#define X\n)"), "directive inside the arguments"));
}

static void test_define() {
    auto nodes = parse("#define X   a b  \n#define F(p, q) q p\n#define E\n#undef X\n");
    assert(nodes.size() == 4);

    auto &x = as<DefNode>(nodes[0]);
    assert(x.kind == NodeKind::Def && x.name == "X");
    assert(x.body.size() == 3);                  // a, ' ', b
    assert(as<IdentNode>(x.body[0]).name == "a");
    assert(as<TextNode>(x.body[1]).isSpace);

    auto &f = as<DefunNode>(nodes[1]);
    assert(f.kind == NodeKind::Defun);
    assert(f.params == (std::vector<std::string>{"p", "q"}));
    assert(f.body.size() == 3);

    assert(as<DefNode>(nodes[2]).body.empty());
    assert(as<UndefNode>(nodes[3]).name == "X");

    auto empty = parse("#define G() 1\n");
    assert(as<DefunNode>(empty[0]).params.empty());

    assert(contains(syntaxError("#define F(x, x) x\n"), "duplicate parameter \"x\""));
    assert(contains(syntaxError("#define\n"), "expected macro name after #define"));
    assert(contains(syntaxError("#undef X Y\n"), "after #undef"));
    assert(contains(syntaxError("#define X \"abc\n"), "unterminated string literal"));
}

static void test_conditionals() {
    auto nodes = parse("#if A\na\n#elif B\nb\n#else\nc\n#endif\n");
    assert(nodes.size() == 1);
    auto &top = as<CondNode>(nodes[0]);
    assert(top.ifTrue.size() == 2);             // a, newline
    assert(top.ifFalse.size() == 1);
    auto &elif = as<CondNode>(top.ifFalse[0]);
    assert(as<IdentNode>(elif.ifTrue[0]).name == "b");
    assert(as<IdentNode>(elif.ifFalse[0]).name == "c");

    auto ifndef = parse("#ifndef G\n#endif\n");
    auto &test = *as<CondNode>(ifndef[0]).test;
    assert(test.kind == BoolKind::Not);
    assert(static_cast<const NotBool &>(test).operand->kind == BoolKind::Defined);

    // Bare arithmetic means "<> 0"; "<=" is "not >"
    auto bare = parse("#if 1 + 2\n#endif\n#if 1 <= 2\n#endif\n");
    assert(as<CondNode>(bare[0]).test->kind == BoolKind::Not);
    auto &le = static_cast<const NotBool &>(*as<CondNode>(bare[1]).test);
    assert(le.operand->kind == BoolKind::Gt);

    assert(syntaxError("#endif\n") == "#endif without #if");
    assert(syntaxError("#else\n") == "#else without #if");
    assert(syntaxError("#if 1\nx\n") == "unterminated #if");
    assert(syntaxError("#if 1\n#else\n") == "unterminated #else");
    assert(syntaxError("#if 1\n#else\n#elif 2\n#endif\n") == "#elif after #else");
    assert(syntaxError("#if\n#endif\n") == "missing expression");
    assert(contains(syntaxError("#if (1\n#endif\n"), "unbalanced parentheses"));
    assert(contains(syntaxError("#ifdef\n#endif\n"), "macro name after #ifdef"));
}

static void test_other_directives() {
    auto nodes = parse("#include \"x.h\"\n#error \"stop\"\n#warning \"hmm\"\n#line 5 \"y.c\"\n# 9\n");
    assert(as<IncludeNode>(nodes[0]).path == "x.h");
    assert(nodes[1]->kind == NodeKind::Error);
    assert(as<MessageNode>(nodes[1]).message == "stop");
    assert(nodes[2]->kind == NodeKind::Warning);
    auto &line = as<LineNode>(nodes[3]);
    assert(line.line == 5 && line.file && *line.file == "y.c");
    auto &bare = as<LineNode>(nodes[4]);
    assert(bare.line == 9 && !bare.file);

    // Directive locations cover the whole line
    assert(nodes[1]->loc.start.line == 2);
    assert(nodes[1]->loc.start.column() == 0);
    assert(nodes[1]->loc.end.offset - nodes[1]->loc.start.offset == 13);

    assert(contains(syntaxError("#include x\n"), "quoted file name after #include"));
    assert(contains(syntaxError("#error stop\n"), "quoted message after #error"));
}

void run_parser_tests() {
    test_calls();
    test_define();
    test_conditionals();
    test_other_directives();
    std::cout << "Parser tests passed\n";
}
