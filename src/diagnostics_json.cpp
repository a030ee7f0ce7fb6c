#include "fnform/diagnostics_json.hpp"
#include "fnform/env.hpp"
#include <sstream>
#include <cstdio>

namespace fnform {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostic_to_json(const form_error& e){
    int ln = e.offending() ? line(*e.offending()) : -1;
    int cl = e.offending() ? col(*e.offending()) : -1;
    std::ostringstream os;
    os<<"{"
        "\"code\":"<<json_escape(errc_name(e.kind()))
        <<",\"message\":"<<json_escape(e.text())
        <<",\"line\":"<<ln
        <<",\"col\":"<<cl
        <<"}";
    return os.str();
}

void maybe_print_json(const form_error& e){
    if(detect_env().diagJson){
        auto js=diagnostic_to_json(e);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

llvm::Error report_form_errors(llvm::Error err){
    return llvm::handleErrors(std::move(err), [](std::unique_ptr<form_error> fe) -> llvm::Error {
        maybe_print_json(*fe);
        return llvm::Error(std::move(fe));
    });
}

} // namespace fnform
