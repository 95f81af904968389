#include "lexpp/Environment.h"

namespace lexpp {

// ── Binding chain ─────────────────────────────────────────────────────────────
// One cell per bind(). A cell owns its definition and the cells before it.
struct Environment::Binding {
    MacroDefPtr              def;
    std::shared_ptr<Binding> next;

    Binding(MacroDefPtr d, std::shared_ptr<Binding> n)
        : def(std::move(d)), next(std::move(n)) {}
    ~Binding();
};

// Each definition holds the environment (and so the chain) it was defined in.
// Releasing the definitions and the tail one cell at a time keeps a long chain
// from being torn down recursively.
Environment::Binding::~Binding() {
    def.reset();
    std::shared_ptr<Binding> tail = std::move(next);
    while (tail && tail.use_count() == 1) {
        tail->def.reset();
        std::shared_ptr<Binding> after = std::move(tail->next);
        tail = std::move(after);
    }
}

// ── Environment ───────────────────────────────────────────────────────────────
Environment::Map::Factory &Environment::factory() {
    // Never canonicalized: trees are shared only along bind()/unbind() lineage.
    static Map::Factory f(/*canonicalize=*/false);
    return f;
}

Environment::Environment() : map_(factory().getEmptyMap()) {}

bool Environment::contains(const std::string &name) const {
    return map_.contains(name);
}

MacroDefPtr Environment::lookup(const std::string &name) const {
    const Binding *const *b = map_.lookup(name);
    return b ? (*b)->def : nullptr;
}

Environment Environment::bind(MacroDefPtr def) const {
    size_t size = contains(def->name) ? size_ : size_ + 1;
    auto cell = std::make_shared<Binding>(std::move(def), owners_);
    Map map = factory().add(map_, cell->def->name, cell.get());
    return Environment(std::move(cell), std::move(map), size);
}

Environment Environment::unbind(const std::string &name) const {
    if (!contains(name)) return *this;
    return Environment(owners_, factory().remove(map_, name), size_ - 1);
}

std::vector<std::string> Environment::names() const {
    std::vector<std::string> out;
    out.reserve(size_);
    for (auto &entry : map_) out.push_back(entry.first.str());
    return out;
}

// ── MacroDef factories ────────────────────────────────────────────────────────
MacroDefPtr MacroDef::object(std::string name, NodeList body,
                             Environment env, SourceLocation loc) {
    auto def  = std::make_shared<MacroDef>();
    def->kind = Kind::Object;
    def->name = std::move(name);
    def->body = std::move(body);
    def->env  = std::move(env);
    def->loc  = std::move(loc);
    return def;
}

MacroDefPtr MacroDef::function(std::string name, std::vector<std::string> params,
                               NodeList body, Environment env, SourceLocation loc) {
    auto def    = std::make_shared<MacroDef>();
    def->kind   = Kind::Function;
    def->name   = std::move(name);
    def->params = std::move(params);
    def->body   = std::move(body);
    def->env    = std::move(env);
    def->loc    = std::move(loc);
    return def;
}

} // namespace lexpp
