// fn_form.hpp - parse and rebuild (fn name? [params] body...) / (fn name? ([params] body...)+)
#pragma once
#include "fnform/node.hpp"
#include "fnform/prefix.hpp"
#include "fnform/clause.hpp"
#include <llvm/Support/Error.h>
#include <vector>

namespace fnform {

inline constexpr const char* fn_head = "fn";

struct parsed_fn {
    node_ptr name;               // symbol, or null for an anonymous fn
    std::vector<clause> clauses; // never empty after a successful parse
};

bool operator==(const parsed_fn& a, const parsed_fn& b);
inline bool operator!=(const parsed_fn& a, const parsed_fn& b) { return !(a == b); }

// Resolve single- vs multi-clause shape of what follows the name and parse every clause.
//   ([x] body...)          -> one clause, the whole sequence
//   (([x] ...) ([x y] ...)) -> one clause per list
llvm::Expected<std::vector<clause>> parse_clauses(forms_ref rest);

// Parse the arguments of a fn form (everything after the `fn` head).
llvm::Expected<parsed_fn> parse_fn(forms_ref forms);

// Parse a whole (fn ...) list; the head symbol is skipped whatever its name.
llvm::Expected<parsed_fn> parse_fn_form(const node_ptr& form);

// A single clause is spliced in place; several clauses are each wrapped in a list.
std::vector<node_ptr> build_clause_forms(const std::vector<clause>& clauses);

node_ptr build_fn(const parsed_fn& fn);

} // namespace fnform
