#pragma once
#include "grammar.hpp"
#include "fnform/node.hpp"
#include <tao/pegtl.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace fnform::reader_front {

// One open collection (or the top level) while reading.
struct frame {
    char kind{0}; // 0 = top level, '(' '[' '{' 's' (set) '#' (tagged) '_' (discard)
    int line{0}, col{0};
    std::string tag;
    std::vector<node_ptr> elems;
};

struct read_state {
    std::vector<frame> frames{ frame{} };
    void push(node_ptr n){ frames.back().elems.push_back(std::move(n)); }
};

inline node_ptr make_int_node(int64_t v){ return detail::make_node(node_data{v}); }

inline void attach_pos(node& n, int sl, int sc, int el, int ec){
    n.metadata["line"] = make_int_node(sl);
    n.metadata["col"] = make_int_node(sc);
    n.metadata["end-line"] = make_int_node(el);
    n.metadata["end-col"] = make_int_node(ec);
}

// Start position of the match plus the position of its last character.
template<typename Input>
void attach_span(node& n, const Input& in, int sl, int sc){
    int el = static_cast<int>(in.position().line), ec = static_cast<int>(in.position().column);
    bool first = true;
    for(char c : in.string_view()){
        if(first){ first = false; continue; }
        if(c == '\n'){ ++el; ec = 0; } else ++ec;
    }
    attach_pos(n, sl, sc, el, ec);
}

template<typename Input>
void attach_span(node& n, const Input& in){
    attach_span(n, in, static_cast<int>(in.position().line), static_cast<int>(in.position().column));
}

namespace actions {
using namespace tao::pegtl;
namespace g = fnform::reader_front::grammar;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< g::symbol_tok > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        std::string s = in.string();
        node_ptr n;
        if(s == "nil") n = detail::make_node(std::monostate{});
        else if(s == "true") n = detail::make_node(true);
        else if(s == "false") n = detail::make_node(false);
        else n = detail::make_node(fnform::symbol{std::move(s)});
        attach_span(*n, in);
        st.push(std::move(n));
    }
};

template<> struct action< g::keyword_tok > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        auto n = detail::make_node(fnform::keyword{in.string().substr(1)});
        attach_span(*n, in);
        st.push(std::move(n));
    }
};

template<> struct action< g::number_tok > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        std::string num = in.string();
        bool is_float = num.find_first_of(".eE") != std::string::npos;
        node_ptr n;
        try {
            if(is_float) n = detail::make_node(std::stod(num));
            else n = detail::make_node(static_cast<int64_t>(std::stoll(num)));
        } catch(const std::out_of_range&){
            throw parse_error("number out of range: " + num, in);
        }
        attach_span(*n, in);
        st.push(std::move(n));
    }
};

template<> struct action< g::string_tok > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        std::string_view raw = in.string_view();
        raw = raw.substr(1, raw.size() - 2);
        std::string out;
        for(size_t i = 0; i < raw.size(); ++i){
            char c = raw[i];
            if(c != '\\'){ out += c; continue; }
            char e = raw[++i];
            switch(e){
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                default: out += e; break;
            }
        }
        auto n = detail::make_node(std::move(out));
        attach_span(*n, in);
        st.push(std::move(n));
    }
};

template<char Kind>
struct open_frame {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f; f.kind = Kind;
        f.line = static_cast<int>(in.position().line);
        f.col = static_cast<int>(in.position().column);
        st.frames.push_back(std::move(f));
    }
};

template<> struct action< g::list_open > : open_frame<'('> {};
template<> struct action< g::vector_open > : open_frame<'['> {};
template<> struct action< g::map_open > : open_frame<'{'> {};
template<> struct action< g::set_open > : open_frame<'s'> {};
template<> struct action< g::discard_mark > : open_frame<'_'> {};

template<> struct action< g::tag_name > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f; f.kind = '#'; f.tag = in.string();
        // the tag starts right after '#'
        f.line = static_cast<int>(in.position().line);
        f.col = static_cast<int>(in.position().column) - 1;
        st.frames.push_back(std::move(f));
    }
};

inline frame pop_frame(read_state& st){
    frame f = std::move(st.frames.back());
    st.frames.pop_back();
    return f;
}

template<> struct action< g::list_form > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f = pop_frame(st);
        fnform::list l; l.elems = std::move(f.elems);
        auto n = detail::make_node(std::move(l));
        attach_span(*n, in, f.line, f.col);
        st.push(std::move(n));
    }
};

template<> struct action< g::vector_form > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f = pop_frame(st);
        fnform::vector_t v; v.elems = std::move(f.elems);
        auto n = detail::make_node(std::move(v));
        attach_span(*n, in, f.line, f.col);
        st.push(std::move(n));
    }
};

template<> struct action< g::set_form > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f = pop_frame(st);
        fnform::set s; s.elems = std::move(f.elems);
        auto n = detail::make_node(std::move(s));
        attach_span(*n, in, f.line, f.col);
        st.push(std::move(n));
    }
};

template<> struct action< g::map_form > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f = pop_frame(st);
        if(f.elems.size() % 2)
            throw parse_error("map requires an even number of forms", in);
        fnform::map m;
        for(size_t i = 0; i < f.elems.size(); i += 2){
            if(map_get(m, f.elems[i]))
                throw parse_error("duplicate map key " + to_string(f.elems[i]), in);
            m.entries.emplace_back(f.elems[i], f.elems[i + 1]);
        }
        auto n = detail::make_node(std::move(m));
        attach_span(*n, in, f.line, f.col);
        st.push(std::move(n));
    }
};

template<> struct action< g::tagged_form > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        frame f = pop_frame(st);
        auto n = detail::make_node(fnform::tagged_value{ fnform::symbol{f.tag}, f.elems.front() });
        attach_span(*n, in, f.line, f.col);
        st.push(std::move(n));
    }
};

template<> struct action< g::discard > {
    template<typename Input>
    static void apply(const Input&, read_state& st){
        st.frames.pop_back();
    }
};

} // namespace actions

// Error messages for must<> failures.
template<typename Rule> inline constexpr const char* error_message = "unexpected input";
template<> inline constexpr const char* error_message< grammar::list_close > = "unterminated list, expected ')'";
template<> inline constexpr const char* error_message< grammar::vector_close > = "unterminated vector, expected ']'";
template<> inline constexpr const char* error_message< grammar::map_close > = "unterminated map, expected '}'";
template<> inline constexpr const char* error_message< grammar::set_close > = "unterminated set, expected '}'";
template<> inline constexpr const char* error_message< grammar::string_close > = "unterminated string";
template<> inline constexpr const char* error_message< grammar::form > = "expected a form";
template<> inline constexpr const char* error_message< tao::pegtl::eof > = "unexpected trailing characters";

template<typename Rule>
struct control : tao::pegtl::normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...){
        throw tao::pegtl::parse_error(error_message<Rule>, in);
    }
};

} // namespace fnform::reader_front
