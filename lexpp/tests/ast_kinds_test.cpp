// Every node kind has a name and is handled by the expander
#include <set>
#include "TestSupport.h"

using namespace lexpp;

static SourceLocation here(unsigned line) {
    SourcePosition p("k.pp", line, 0, 0);
    return {p, p};
}

static void test_kind_names() {
    std::set<std::string> seen;
    const ArithKind arith[] = {
        ArithKind::Int, ArithKind::Ident, ArithKind::Neg, ArithKind::Add,
        ArithKind::Sub, ArithKind::Mul, ArithKind::Div, ArithKind::Mod,
        ArithKind::Lnot, ArithKind::Lsl, ArithKind::Lsr, ArithKind::Asr,
        ArithKind::Land, ArithKind::Lor, ArithKind::Lxor,
    };
    for (auto k : arith) seen.insert(kindName(k));
    assert(seen.size() == 15 && !seen.count("?"));

    seen.clear();
    const BoolKind boolean[] = {
        BoolKind::True, BoolKind::False, BoolKind::Defined, BoolKind::Not,
        BoolKind::And, BoolKind::Or, BoolKind::Eq, BoolKind::Lt, BoolKind::Gt,
    };
    for (auto k : boolean) seen.insert(kindName(k));
    assert(seen.size() == 9 && !seen.count("?"));

    seen.clear();
    const NodeKind nodes[] = {
        NodeKind::Ident, NodeKind::Def, NodeKind::Defun, NodeKind::Undef,
        NodeKind::Include, NodeKind::Cond, NodeKind::Error, NodeKind::Warning,
        NodeKind::Text, NodeKind::Seq, NodeKind::Line, NodeKind::CurrentLine,
        NodeKind::CurrentFile,
    };
    for (auto k : nodes) seen.insert(kindName(k));
    assert(seen.size() == 13 && !seen.count("?"));
}

// One node of each kind, built by hand, through one expansion.
static void test_expand_every_kind() {
    auto text = [](const char *s, unsigned line) {
        return std::make_shared<TextNode>(false, s, here(line));
    };

    NodeList nodes;
    nodes.push_back(std::make_shared<DefNode>("A", NodeList{text("a", 1)}, here(1)));
    nodes.push_back(std::make_shared<DefunNode>("F", std::vector<std::string>{"p"},
                                                NodeList{std::make_shared<IdentNode>(
                                                    "p", std::nullopt, here(2))},
                                                here(2)));
    nodes.push_back(std::make_shared<IdentNode>("A", std::nullopt, here(3)));
    nodes.push_back(std::make_shared<IdentNode>(
        "F", std::vector<NodeList>{NodeList{text("f", 4)}}, here(4)));
    nodes.push_back(std::make_shared<UndefNode>("A", here(5)));
    nodes.push_back(std::make_shared<IncludeNode>("inc.h", here(6)));
    nodes.push_back(std::make_shared<CondNode>(
        std::make_unique<DefinedBool>("A", here(7)),
        NodeList{text("yes", 7)}, NodeList{text("no", 7)}, here(7)));
    nodes.push_back(std::make_shared<MessageNode>(NodeKind::Warning, "w", here(8)));
    nodes.push_back(std::make_shared<TextNode>(true, " ", here(9)));
    nodes.push_back(std::make_shared<SeqNode>(NodeList{text("s", 10)}, here(10)));
    nodes.push_back(std::make_shared<LineNode>(std::nullopt, 42, here(11)));
    nodes.push_back(std::make_shared<MarkerNode>(NodeKind::CurrentLine, here(12)));
    nodes.push_back(std::make_shared<MarkerNode>(NodeKind::CurrentFile, here(13)));

    MemorySourceLoader loader;
    loader.add("inc.h", "i");
    DiagEngine diag(false);
    std::string out;
    ExpandOptions opts;
    opts.lineMarkers = false;
    Expander ex(out, diag, loader, opts);
    Environment env = ex.expandSource("k.pp", nodes, Environment());

    assert(out == "afino s\n# 42\n 12  \"k.pp\" ");
    assert(env.contains("F") && !env.contains("A"));
    assert(diag.warningCount() == 1);

    NodeList fatal{std::make_shared<MessageNode>(NodeKind::Error, "e", here(14))};
    auto err = lexpp_test::expectError([&] { ex.expandSource("k.pp", fatal, env); });
    assert(err.kind() == ErrorKind::User);
}

void run_ast_kinds_tests() {
    test_kind_names();
    test_expand_every_kind();
    std::cout << "AST kind tests passed\n";
}
