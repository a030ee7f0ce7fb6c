#pragma once
#include <tao/pegtl.hpp>

namespace fnform::reader_front::grammar {
using namespace tao::pegtl;

// Separators: whitespace, commas and line comments
struct line_comment : seq< one<';'>, until< eolf > > {};
struct separator : sor< space, one<','>, line_comment > {};

struct form;
struct skip;

// #_ form -- read and dropped
struct discard_mark : string<'#','_'> {};
struct discard : seq< discard_mark, skip, must< form > > {};
struct skip : star< sor< separator, discard > > {};

// Atoms
struct symbol_first : sor< alpha, one<'*','!','_','?','-','+','/','<','>','=','$','%','&','.'> > {};
struct symbol_rest : sor< symbol_first, digit, one<'#',':','\''> > {};
struct symbol_tok : seq< symbol_first, star< symbol_rest > > {};
struct keyword_tok : seq< one<':'>, plus< symbol_rest > > {};

struct frac : seq< one<'.'>, star< digit > > {};
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct number_tok : seq< opt< one<'+','-'> >, plus< digit >, opt< frac >, opt< exponent >, not_at< symbol_rest > > {};

struct escaped : seq< one<'\\'>, any > {};
struct string_char : sor< escaped, not_one<'"','\\'> > {};
struct string_close : one<'"'> {};
struct string_tok : seq< one<'"'>, star< string_char >, must< string_close > > {};

// Collections
struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct vector_open : one<'['> {};
struct vector_close : one<']'> {};
struct map_open : one<'{'> {};
struct map_close : one<'}'> {};
struct set_open : string<'#','{'> {};
struct set_close : one<'}'> {};

template<typename Open, typename Close>
struct collection : seq< Open, skip, star< form, skip >, must< Close > > {};

struct list_form : collection< list_open, list_close > {};
struct vector_form : collection< vector_open, vector_close > {};
struct map_form : collection< map_open, map_close > {};
struct set_form : collection< set_open, set_close > {};

struct tag_name : symbol_tok {};
struct tagged_form : seq< one<'#'>, tag_name, skip, must< form > > {};

struct form : sor< list_form, vector_form, map_form, set_form, tagged_form, string_tok, number_tok, keyword_tok, symbol_tok > {};

struct single_rule : must< skip, form, skip, eof > {};
struct many_rule : must< skip, star< form, skip >, eof > {};

} // namespace fnform::reader_front::grammar
