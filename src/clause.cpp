#include "fnform/clause.hpp"
#include "fnform/error.hpp"
#include "fnform/env.hpp"
#include <cstdio>

namespace fnform {

bool operator==(const clause& a, const clause& b){
    if(!equal(a.params, b.params) || !equal(a.prepost, b.prepost)) return false;
    if(a.body.size() != b.body.size()) return false;
    for(size_t i = 0; i < a.body.size(); ++i) if(!equal(a.body[i], b.body[i])) return false;
    return true;
}

std::vector<node_ptr> clause_elements(const node_ptr& raw){
    if(raw){
        if(auto* l = as_list(*raw)) return l->elems;
        if(auto* v = as_vector(*raw)) return v->elems;
    }
    return { raw };
}

llvm::Expected<clause> parse_clause(forms_ref elems, signature_shape shape, const node_ptr& sig){
    node_ptr params = elems.empty() ? nullptr : elems.front();
    if(!is_vector_form(params)){
        if(shape == signature_shape::multi_clause)
            return make_invalid_argument_error(form_errc::malformed_signature,
                "parameter declaration " + to_string(params) + " should be a vector", params ? params : sig);
        return make_invalid_argument_error(form_errc::ambiguous_signature,
            "invalid signature: " + to_string(sig) + " should be a list", sig);
    }

    auto pp = extract_prefix(elems.drop_front(), [](const node_ptr& m){ return clone(m); }, is_map_form, node_ptr{});

    clause c;
    c.params = clone(params);
    c.prepost = std::move(pp.value);
    for(auto& form : pp.rest) c.body.push_back(clone(form));
    if(detect_env().trace)
        fprintf(stderr, "[dbg][parse-clause] params=%s prepost=%d body=%zu\n", to_string(c.params).c_str(), c.prepost?1:0, c.body.size());
    return std::move(c);
}

std::vector<node_ptr> build_clause(const clause& c){
    std::vector<node_ptr> out;
    out.reserve(c.body.size() + 2);
    out.push_back(clone(c.params));
    if(c.prepost) out.push_back(clone(c.prepost));
    for(auto& form : c.body) out.push_back(clone(form));
    return out;
}

} // namespace fnform
