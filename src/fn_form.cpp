#include "fnform/fn_form.hpp"
#include "fnform/error.hpp"
#include "fnform/env.hpp"
#include <cstdio>

namespace fnform {

bool operator==(const parsed_fn& a, const parsed_fn& b){
    return equal(a.name, b.name) && a.clauses == b.clauses;
}

static node_ptr clone_form(const node_ptr& n){ return clone(n); }

llvm::Expected<std::vector<clause>> parse_clauses(forms_ref rest){
    if(rest.empty() || !(is_vector_form(rest.front()) || is_list_form(rest.front())))
        return make_invalid_argument_error(form_errc::missing_parameters, "parameter declaration missing",
                                           rest.empty() ? nullptr : rest.front());

    // Shape is fixed here from the first element and shared by every clause below.
    const signature_shape shape = is_vector_form(rest.front()) ? signature_shape::single_clause
                                                               : signature_shape::multi_clause;
    if(detect_env().trace)
        fprintf(stderr, "[dbg][parse-clauses] shape=%s forms=%zu\n",
                shape == signature_shape::single_clause ? "single" : "multi", rest.size());

    std::vector<clause> out;
    if(shape == signature_shape::single_clause){
        auto sig = node_list(std::vector<node_ptr>(rest.begin(), rest.end()));
        sig->metadata = rest.front()->metadata;
        auto c = parse_clause(rest, shape, sig);
        if(!c) return c.takeError();
        out.push_back(std::move(*c));
        return std::move(out);
    }
    for(const node_ptr& raw : rest){
        auto c = parse_clause(clause_elements(raw), shape, raw);
        if(!c) return c.takeError();
        out.push_back(std::move(*c));
    }
    return std::move(out);
}

llvm::Expected<parsed_fn> parse_fn(forms_ref forms){
    auto nm = extract_prefix(forms, clone_form, is_symbol_form, node_ptr{});
    auto clauses = parse_clauses(nm.rest);
    if(!clauses) return clauses.takeError();
    if(detect_env().trace)
        fprintf(stderr, "[dbg][parse-fn] name=%s clauses=%zu\n", nm.value ? to_string(nm.value).c_str() : "-", clauses->size());
    return parsed_fn{ std::move(nm.value), std::move(*clauses) };
}

llvm::Expected<parsed_fn> parse_fn_form(const node_ptr& form){
    const list* l = form ? as_list(*form) : nullptr;
    if(!l || l->elems.empty()) return parse_fn(forms_ref());
    return parse_fn(forms_ref(l->elems).drop_front());
}

std::vector<node_ptr> build_clause_forms(const std::vector<clause>& clauses){
    if(clauses.size() == 1) return build_clause(clauses.front());
    std::vector<node_ptr> out;
    out.reserve(clauses.size());
    for(const auto& c : clauses) out.push_back(node_list(build_clause(c)));
    return out;
}

node_ptr build_fn(const parsed_fn& fn){
    list l;
    l << n_sym(fn_head);
    if(fn.name) l << clone(fn.name);
    for(auto& f : build_clause_forms(fn.clauses)) l << f;
    return detail::make_node(std::move(l));
}

} // namespace fnform
