#include "fnform/defn_form.hpp"
#include "fnform/error.hpp"
#include "fnform/env.hpp"
#include <cstdio>

namespace fnform {

bool operator==(const parsed_defn& a, const parsed_defn& b){
    return equal(a.name, b.name) && equal(a.metadata, b.metadata) && a.clauses == b.clauses;
}

llvm::Expected<parsed_defn> parse_defn(forms_ref forms){
    if(forms.empty() || !is_symbol_form(forms.front()))
        return make_invalid_argument_error(form_errc::missing_name,
            "first argument to defn must be a symbol, got " + (forms.empty() ? std::string("nothing") : to_string(forms.front())),
            forms.empty() ? nullptr : forms.front());

    node_ptr name = clone(forms.front());

    auto doc = extract_prefix(forms.drop_front(),
        [](const node_ptr& s){ return node_map({ kvp(n_kw(doc_key), clone(s)) }); },
        is_string_form, node_map());

    auto attrs = extract_prefix(doc.rest,
        [&](const node_ptr& m){
            auto merged = clone(doc.value);
            auto& entries = std::get<map>(merged->data);
            for(auto& kv : std::get<map>(m->data).entries) map_assoc(entries, clone(kv.first), clone(kv.second));
            return merged;
        },
        is_map_form, doc.value);

    auto clauses = parse_clauses(attrs.rest);
    if(!clauses) return clauses.takeError();
    if(detect_env().trace)
        fprintf(stderr, "[dbg][parse-defn] name=%s meta=%s clauses=%zu\n",
                to_string(name).c_str(), to_string(attrs.value).c_str(), clauses->size());
    return parsed_defn{ std::move(name), std::move(attrs.value), std::move(*clauses) };
}

llvm::Expected<parsed_defn> parse_defn_form(const node_ptr& form){
    const list* l = form ? as_list(*form) : nullptr;
    if(!l || l->elems.empty()) return parse_defn(forms_ref());
    return parse_defn(forms_ref(l->elems).drop_front());
}

node_ptr build_defn(const parsed_defn& defn){
    list l;
    l << n_sym(defn_head) << clone(defn.name);
    const map* meta = defn.metadata ? as_map(*defn.metadata) : nullptr;
    if(meta && !meta->entries.empty()) l << clone(defn.metadata);
    for(auto& f : build_clause_forms(defn.clauses)) l << f;
    return detail::make_node(std::move(l));
}

std::optional<std::string> docstring(const parsed_defn& defn){
    const map* meta = defn.metadata ? as_map(*defn.metadata) : nullptr;
    if(!meta) return std::nullopt;
    auto v = map_get(*meta, n_kw(doc_key));
    if(v && is_string(*v)) return std::get<std::string>(v->data);
    return std::nullopt;
}

} // namespace fnform
