#include "fnform/env.hpp"
#include <cstdlib>

namespace fnform {

form_env detect_env(){
    form_env e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto enabled = [](const char* v){ return v[0]=='1'||v[0]=='y'||v[0]=='Y'||v[0]=='t'||v[0]=='T'; };

    if (const char* v = get("FNFORM_TRACE")) e.trace = enabled(v);
    if (const char* v = get("FNFORM_DIAG_JSON")) e.diagJson = enabled(v);

    return e;
}

} // namespace fnform
