#pragma once
#include "fnform/node.hpp"
#include "fnform/fn_form.hpp"
#include "fnform/defn_form.hpp"
#include <llvm/Support/Error.h>
#include <unordered_map>
#include <functional>
#include <optional>
#include <string>

namespace fnform {

// Macro expansion host for definition-rewriting macros.
//
// Macros: signature llvm::Expected<std::optional<node_ptr>>(const list& form)
//   Return std::nullopt if not applicable (allows arity-based conditional expansion).
//   Return an error to abort the whole expansion; it reaches the caller of expand().
//   The returned value is expanded again (so macros can expand to macros), except
//   that a macro is not re-applied to the head of its own output.
class transformer {
public:
    using macro_fn = std::function<llvm::Expected<std::optional<node_ptr>>(const list&)>;

    // Register a macro associated to head symbol name.
    transformer& add_macro(std::string name, macro_fn fn) {
        macros_[std::move(name)] = std::move(fn); return *this;
    }
    bool has_macro(const std::string& name) const { return macros_.count(name) != 0; }

    // Expand macros (returns a deep-copied expanded value separate from input)
    llvm::Expected<node_ptr> expand(const node_ptr& n) { return expand_impl(n, nullptr); }

private:
    std::unordered_map<std::string, macro_fn> macros_;

    llvm::Expected<node_ptr> expand_impl(const node_ptr& n, const std::string* blocked);
    llvm::Expected<node_ptr> expand_children(const node_ptr& n);
};

using fn_rewrite = std::function<llvm::Expected<parsed_fn>(parsed_fn)>;
using defn_rewrite = std::function<llvm::Expected<parsed_defn>(parsed_defn)>;

// (name ...) is parsed with parse_fn, handed to rewrite, and replaced by build_fn of the result.
void add_fn_macro(transformer& tx, std::string name, fn_rewrite rewrite);
// (name ...) is parsed with parse_defn, handed to rewrite, and replaced by build_defn of the result.
void add_defn_macro(transformer& tx, std::string name, defn_rewrite rewrite);

// defn-: a defn whose metadata gains :private true.
void register_definition_macros(transformer& tx);

} // namespace fnform
