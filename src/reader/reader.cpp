#include "fnform/reader.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

namespace fnform {
using namespace fnform::reader_front;

namespace {

template<typename Rule>
llvm::Expected<std::vector<node_ptr>> run(std::string_view src, std::string_view source_name){
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(source_name));
    read_state st;
    try {
        tao::pegtl::parse< Rule, actions::action, control >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        return llvm::make_error<read_error>(std::string(e.message()), std::string(source_name), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    return std::move(st.frames.front().elems);
}

} // namespace

llvm::Expected<node_ptr> read(std::string_view src, std::string_view source_name){
    auto forms = run<reader_front::grammar::single_rule>(src, source_name);
    if(!forms) return forms.takeError();
    return forms->front();
}

llvm::Expected<std::vector<node_ptr>> read_all(std::string_view src, std::string_view source_name){
    return run<reader_front::grammar::many_rule>(src, source_name);
}

} // namespace fnform
