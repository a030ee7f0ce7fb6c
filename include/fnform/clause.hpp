// clause.hpp - one arity of a fn/defn: ([params] {prepost}? body...)
#pragma once
#include "fnform/node.hpp"
#include "fnform/prefix.hpp"
#include <llvm/Support/Error.h>
#include <vector>

namespace fnform {

struct clause {
    node_ptr params;             // always a vector, possibly empty
    node_ptr prepost;            // {:pre [...] :post [...]} map, or null
    std::vector<node_ptr> body;  // may be empty
};

// Structural comparison, metadata ignored.
bool operator==(const clause& a, const clause& b);
inline bool operator!=(const clause& a, const clause& b) { return !(a == b); }

// Which branch of the grammar a declaration took. Decided once from the shape
// of the whole declaration and used for every clause's error message.
enum class signature_shape { single_clause, multi_clause };

// Elements of one raw clause form: the items of a list or vector, otherwise the
// form itself as a one-element sequence. The result owns its pointers, so raw
// may be a temporary.
std::vector<node_ptr> clause_elements(const node_ptr& raw);

// Parse the elements of one clause. `sig` is the form named by the
// single-clause error message.
llvm::Expected<clause> parse_clause(forms_ref elems, signature_shape shape, const node_ptr& sig);

// [params] ++ [prepost] ++ body
std::vector<node_ptr> build_clause(const clause& c);

} // namespace fnform
