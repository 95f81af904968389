#include "lexpp/Predefine.h"
#include "lexpp/Expander.h"
#include "lexpp/Parser.h"
#include "lexpp/SourceLoader.h"

namespace lexpp {

std::string defineDirective(const std::string &def) {
    auto eq = def.find('=');
    std::string head  = (eq == std::string::npos) ? def : def.substr(0, eq);
    std::string value = (eq == std::string::npos) ? "" : def.substr(eq + 1);

    std::string line = "#define " + head;
    if (!value.empty()) {
        line += ' ';
        // Newlines in the value continue the body.
        for (char c : value) {
            if (c == '\n') line += "\\\n";
            else           line += c;
        }
    }
    line += '\n';
    return line;
}

Environment predefine(const std::vector<std::string> &defs,
                      const std::vector<std::string> &undefs,
                      DiagEngine &diag) {
    std::string src;
    for (auto &d : defs) src += defineDirective(d);

    NodeList nodes = parseSource(src, kCommandLineSource);

    std::string      discard;
    FileSourceLoader loader;
    Expander         expander(discard, diag, loader);
    Environment env = expander.expandSource(kCommandLineSource, nodes, Environment());

    for (auto &u : undefs) env = env.unbind(u);
    return env;
}

} // namespace lexpp
