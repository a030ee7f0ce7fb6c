// Code-as-data node representation with metadata & source positions
#pragma once
#include <string>
#include <variant>
#include <vector>
#include <memory>
#include <map>
#include <cstdint>
#include <initializer_list>
#include <utility>

namespace fnform
{

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct set;
    struct map;
    struct tagged_value;
    struct node; // forward declarations

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct set
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };
    struct tagged_value
    {
        symbol tag;
        node_ptr inner;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, set, map, tagged_value>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Structural deep equality of two nodes. If ignore_metadata is true, metadata maps are ignored.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    // Deep copy; the result shares no node with the input.
    node_ptr clone(const node_ptr &n);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }
    // Pretty printer with newlines and indentation for readability
    std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return p ? to_pretty_string(*p, indentWidth) : std::string("nil"); }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_map(const node &n) { return std::holds_alternative<map>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    // Anything the definition grammar never looks inside: numbers, keywords, sets, bodies...
    inline bool is_opaque(const node &n) { return !is_symbol(n) && !is_list(n) && !is_vector(n) && !is_map(n) && !is_string(n); }

    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const map *as_map(const node &n) { return is_map(n) ? &std::get<map>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const std::string *as_string(const node &n) { return is_string(n) ? &std::get<std::string>(n.data) : nullptr; }

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end() || !it->second)
            return def;
        auto &nd = *it->second;
        if (std::holds_alternative<int64_t>(nd.data))
            return (int)std::get<int64_t>(nd.data);
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }
    inline int end_line(const node &n) { return meta_int(n, "end-line"); }
    inline int end_col(const node &n) { return meta_int(n, "end-col"); }

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
    }

    // ------ Factory helpers ------

    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }

    inline node_ptr node_list() { return detail::make_node(list{}); }
    inline node_ptr node_vec() { return detail::make_node(vector_t{}); }
    inline node_ptr node_set() { return detail::make_node(set{}); }
    inline node_ptr node_map() { return detail::make_node(map{}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_list(std::vector<node_ptr> xs)
    {
        list l;
        l.elems = std::move(xs);
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs)
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }
    inline node_ptr node_set(std::initializer_list<node_ptr> xs)
    {
        set s;
        s.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(s));
    }
    inline node_ptr node_map(std::initializer_list<std::pair<node_ptr, node_ptr>> xs)
    {
        map m;
        m.entries.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(m));
    }

    inline std::pair<node_ptr, node_ptr> kvp(node_ptr k, node_ptr v) { return {std::move(k), std::move(v)}; }

    // Mapping helpers. Keys are compared structurally, ignoring metadata.
    node_ptr map_get(const map &m, const node_ptr &key);
    // Insert or replace; an existing key keeps its position.
    void map_assoc(map &m, node_ptr key, node_ptr value);

    // Append operators for collection types
    inline list &operator<<(list &l, const node_ptr &n)
    {
        l.elems.push_back(n);
        return l;
    }
    inline vector_t &operator<<(vector_t &v, const node_ptr &n)
    {
        v.elems.push_back(n);
        return v;
    }
    inline map &operator<<(map &m, const std::pair<node_ptr, node_ptr> &kv)
    {
        map_assoc(m, kv.first, kv.second);
        return m;
    }

} // namespace fnform
