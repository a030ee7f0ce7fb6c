// defn_form.hpp - parse and rebuild (defn name "doc"? {attrs}? clauses...)
#pragma once
#include "fnform/node.hpp"
#include "fnform/prefix.hpp"
#include "fnform/clause.hpp"
#include "fnform/fn_form.hpp"
#include <llvm/Support/Error.h>
#include <optional>
#include <string>
#include <vector>

namespace fnform {

inline constexpr const char* defn_head = "defn";
inline constexpr const char* doc_key = "doc";

struct parsed_defn {
    node_ptr name;               // symbol
    node_ptr metadata;           // map; empty when there was neither docstring nor attribute map
    std::vector<clause> clauses; // never empty after a successful parse
};

bool operator==(const parsed_defn& a, const parsed_defn& b);
inline bool operator!=(const parsed_defn& a, const parsed_defn& b) { return !(a == b); }

// Parse the arguments of a defn form (everything after the `defn` head).
// A docstring seeds {:doc "..."}; an attribute map is merged over it.
llvm::Expected<parsed_defn> parse_defn(forms_ref forms);

// Parse a whole (defn ...) list; the head symbol is skipped whatever its name.
llvm::Expected<parsed_defn> parse_defn_form(const node_ptr& form);

// (defn name clauses...) or (defn name {metadata} clauses...). The docstring is
// never split back out of the metadata map.
node_ptr build_defn(const parsed_defn& defn);

// The :doc entry, if it is a string.
std::optional<std::string> docstring(const parsed_defn& defn);

} // namespace fnform
