#include "fnform/transform.hpp"
#include "fnform/diagnostics_json.hpp"
#include "fnform/env.hpp"
#include <cstdio>

namespace fnform {

llvm::Expected<node_ptr> transformer::expand_impl(const node_ptr& n, const std::string* blocked){
    if(!n) return n;
    if(!std::holds_alternative<list>(n->data)) return expand_children(n);

    const auto& l = std::get<list>(n->data);
    if(!l.elems.empty() && l.elems[0] && std::holds_alternative<symbol>(l.elems[0]->data)){
        const std::string& name = std::get<symbol>(l.elems[0]->data).name;
        auto it = macros_.find(name);
        if(it != macros_.end() && (!blocked || *blocked != name)){
            auto maybe = it->second(l);
            if(!maybe) return report_form_errors(maybe.takeError());
            if(*maybe){
                if(detect_env().trace) fprintf(stderr, "[dbg][expand] macro=%s\n", name.c_str());
                return expand_impl(**maybe, &it->first); // expand inside result
            }
        }
    }
    return expand_children(n);
}

llvm::Expected<node_ptr> transformer::expand_children(const node_ptr& n){
    auto copy = std::make_shared<node>();
    for(auto& kv : n->metadata) copy->metadata[kv.first] = clone(kv.second);
    if(std::holds_alternative<list>(n->data)){
        list out; for(auto& c : std::get<list>(n->data).elems){ auto e = expand_impl(c, nullptr); if(!e) return e.takeError(); out.elems.push_back(std::move(*e)); }
        copy->data = std::move(out); return copy; }
    if(std::holds_alternative<vector_t>(n->data)){
        vector_t out; for(auto& c : std::get<vector_t>(n->data).elems){ auto e = expand_impl(c, nullptr); if(!e) return e.takeError(); out.elems.push_back(std::move(*e)); }
        copy->data = std::move(out); return copy; }
    if(std::holds_alternative<set>(n->data)){
        set out; for(auto& c : std::get<set>(n->data).elems){ auto e = expand_impl(c, nullptr); if(!e) return e.takeError(); out.elems.push_back(std::move(*e)); }
        copy->data = std::move(out); return copy; }
    if(std::holds_alternative<map>(n->data)){
        map out;
        for(auto& kv : std::get<map>(n->data).entries){
            auto k = expand_impl(kv.first, nullptr); if(!k) return k.takeError();
            auto v = expand_impl(kv.second, nullptr); if(!v) return v.takeError();
            out.entries.emplace_back(std::move(*k), std::move(*v));
        }
        copy->data = std::move(out); return copy; }
    if(std::holds_alternative<tagged_value>(n->data)){
        auto& tv = std::get<tagged_value>(n->data);
        auto inner = expand_impl(tv.inner, nullptr); if(!inner) return inner.takeError();
        copy->data = tagged_value{ tv.tag, std::move(*inner) }; return copy; }
    return clone(n); // atom
}

// The rebuilt form keeps the source position of the form it replaces.
static node_ptr with_position_of(node_ptr out, const list& form){
    if(!form.elems.empty() && form.elems.front())
        for(auto& kv : form.elems.front()->metadata) out->metadata[kv.first] = clone(kv.second);
    return out;
}

void add_fn_macro(transformer& tx, std::string name, fn_rewrite rewrite){
    tx.add_macro(std::move(name), [rewrite = std::move(rewrite)](const list& form) -> llvm::Expected<std::optional<node_ptr>> {
        auto parsed = parse_fn(forms_ref(form.elems).drop_front());
        if(!parsed) return parsed.takeError();
        auto out = rewrite(std::move(*parsed));
        if(!out) return out.takeError();
        return std::optional<node_ptr>(with_position_of(build_fn(*out), form));
    });
}

void add_defn_macro(transformer& tx, std::string name, defn_rewrite rewrite){
    tx.add_macro(std::move(name), [rewrite = std::move(rewrite)](const list& form) -> llvm::Expected<std::optional<node_ptr>> {
        auto parsed = parse_defn(forms_ref(form.elems).drop_front());
        if(!parsed) return parsed.takeError();
        auto out = rewrite(std::move(*parsed));
        if(!out) return out.takeError();
        return std::optional<node_ptr>(with_position_of(build_defn(*out), form));
    });
}

void register_definition_macros(transformer& tx){
    add_defn_macro(tx, "defn-", [](parsed_defn d) -> llvm::Expected<parsed_defn> {
        map_assoc(std::get<map>(d.metadata->data), n_kw("private"), n_bool(true));
        return std::move(d);
    });
}

} // namespace fnform
