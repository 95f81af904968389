#pragma once
#include "lexpp/AST.h"
#include "llvm/ADT/ImmutableMap.h"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lexpp {

struct MacroDef;
using MacroDefPtr = std::shared_ptr<const MacroDef>;

// ── Environment ───────────────────────────────────────────────────────────────
// Persistent mapping from macro name to definition. bind()/unbind() return a
// new environment and never touch the receiver, so a definition can hold the
// environment it was defined in for as long as it lives.
//
// Names are indexed by an llvm::ImmutableMap, so a new environment shares all
// but O(log n) tree nodes with the one it came from. The tree only stores raw
// pointers; the definitions themselves are kept alive by `owners_`, a chain of
// every binding made on the way to this environment.
class Environment {
public:
    Environment();

    bool        contains(const std::string &name) const;
    MacroDefPtr lookup(const std::string &name) const;   // null when unbound

    // Adds or replaces the binding for def->name.
    Environment bind(MacroDefPtr def) const;
    Environment unbind(const std::string &name) const;

    size_t                   size()  const { return size_; }
    bool                     empty() const { return size_ == 0; }
    std::vector<std::string> names() const;   // sorted

private:
    struct Binding;

    // Keys point into the bound definition's name.
    struct BindingInfo {
        using value_type     = const std::pair<llvm::StringRef, const Binding *>;
        using value_type_ref = const value_type &;
        using key_type       = const llvm::StringRef;
        using key_type_ref   = const llvm::StringRef &;
        using data_type      = const Binding *const;
        using data_type_ref  = const Binding *const &;

        static key_type_ref  KeyOfValue(value_type_ref v)  { return v.first; }
        static data_type_ref DataOfValue(value_type_ref v) { return v.second; }

        static bool isEqual(key_type_ref l, key_type_ref r) { return l == r; }
        static bool isLess(key_type_ref l, key_type_ref r)  { return l < r; }
        static bool isDataEqual(data_type_ref l, data_type_ref r) { return l == r; }

        static void Profile(llvm::FoldingSetNodeID &id, value_type_ref v) {
            id.AddString(v.first);
            id.AddPointer(v.second);
        }
    };

    using Map = llvm::ImmutableMap<llvm::StringRef, const Binding *, BindingInfo>;

    static Map::Factory &factory();

    Environment(std::shared_ptr<Binding> owners, Map map, size_t size)
        : owners_(std::move(owners)), map_(std::move(map)), size_(size) {}

    // Declared before map_ so that the tree is released first.
    std::shared_ptr<Binding> owners_;
    Map                      map_;
    size_t                   size_ = 0;
};

// ── Macro definition ──────────────────────────────────────────────────────────
struct MacroDef {
    enum class Kind { Object, Function };

    Kind                     kind = Kind::Object;
    std::string              name;
    std::vector<std::string> params;   // Function only
    NodeList                 body;
    Environment              env;      // captured at the definition site
    SourceLocation           loc;

    bool isFunction() const { return kind == Kind::Function; }

    static MacroDefPtr object(std::string name, NodeList body,
                              Environment env, SourceLocation loc);
    static MacroDefPtr function(std::string name, std::vector<std::string> params,
                                NodeList body, Environment env, SourceLocation loc);
};

} // namespace lexpp
