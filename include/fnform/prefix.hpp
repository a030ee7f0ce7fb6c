// prefix.hpp - peel one optional leading element off a form sequence
#pragma once
#include "fnform/node.hpp"
#include <llvm/ADT/ArrayRef.h>
#include <utility>

namespace fnform {

using forms_ref = llvm::ArrayRef<node_ptr>;

template<typename T>
struct prefix_result {
    T value;
    forms_ref rest;
};

// If forms is non-empty and pred(forms[0]) holds, yields {transform(forms[0]), forms[1..]};
// otherwise {def, forms}. Consumes at most one element and never touches the
// underlying sequence.
template<typename T, typename Transform, typename Pred>
prefix_result<T> extract_prefix(forms_ref forms, Transform&& transform, Pred&& pred, T def){
    if(!forms.empty() && pred(forms.front()))
        return prefix_result<T>{ transform(forms.front()), forms.drop_front() };
    return prefix_result<T>{ std::move(def), forms };
}

// Predicates for the optional prefixes of fn/defn forms.
inline bool is_symbol_form(const node_ptr& n){ return n && is_symbol(*n); }
inline bool is_string_form(const node_ptr& n){ return n && is_string(*n); }
inline bool is_map_form(const node_ptr& n){ return n && is_map(*n); }
inline bool is_vector_form(const node_ptr& n){ return n && is_vector(*n); }
inline bool is_list_form(const node_ptr& n){ return n && is_list(*n); }

} // namespace fnform
