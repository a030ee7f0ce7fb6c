// Compact and pretty printers for node trees.
#include "fnform/node.hpp"
#include <functional>
#include <sstream>

namespace fnform
{
    namespace
    {
        std::string quote(const std::string &s)
        {
            std::string out = "\"";
            for (char c : s)
            {
                switch (c)
                {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    out += c;
                    break;
                }
            }
            out += '"';
            return out;
        }

        std::string join(const std::vector<node_ptr> &elems, const char *open, char close)
        {
            std::string out = open;
            bool first = true;
            for (auto &ch : elems)
            {
                if (!first)
                    out += ' ';
                first = false;
                out += to_string(ch);
            }
            out += close;
            return out;
        }

        std::string format_double(double d)
        {
            std::ostringstream oss;
            oss << d;
            std::string s = oss.str();
            // keep a float a float when read back
            if (s.find_first_of(".eEn") == std::string::npos)
                s += ".0";
            return s;
        }
    } // namespace

    std::string to_string(const node &n)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const { return format_double(d); }
            std::string operator()(const std::string &s) const { return quote(s); }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string operator()(const list &l) const { return join(l.elems, "(", ')'); }
            std::string operator()(const vector_t &v) const { return join(v.elems, "[", ']'); }
            std::string operator()(const set &s) const { return join(s.elems, "#{", '}'); }
            std::string operator()(const map &m) const
            {
                std::string out = "{";
                bool first = true;
                for (auto &kv : m.entries)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(kv.first) + ' ' + to_string(kv.second);
                }
                out += '}';
                return out;
            }
            std::string operator()(const tagged_value &tv) const { return '#' + tv.tag.name + ' ' + to_string(tv.inner); }
        };
        return std::visit(V{}, n.data);
    }

    std::string to_pretty_string(const node &n, int indentWidth)
    {
        // Compact single-line output for short collections of atoms. Definition
        // heads (fn, defn, ...) and nested collections break onto indented lines.

        auto indentStr = [](int spaces) -> std::string {
            if (spaces < 0) spaces = 0;
            return std::string(static_cast<size_t>(spaces), ' ');
        };

        auto is_atomic = [](const node &x) -> bool {
            return !std::holds_alternative<list>(x.data) &&
                   !std::holds_alternative<vector_t>(x.data) &&
                   !std::holds_alternative<set>(x.data) &&
                   !std::holds_alternative<map>(x.data) &&
                   !std::holds_alternative<tagged_value>(x.data);
        };

        const size_t MAX_INLINE_LEN = 90; // heuristic

        std::function<std::string(const node*, int)> pp = [&](const node *x, int indent) -> std::string {
            if (!x) return "nil";
            if (is_atomic(*x)) return to_string(*x);

            auto join_inline = [&](const std::vector<node_ptr>& elems, const char* openS, char closeC)->std::string {
                std::string out = openS; bool first=true; for(auto &e: elems){ if(!first) out+=' '; first=false; out+=pp(e.get(), indent); if(out.size()>MAX_INLINE_LEN) return std::string(); } out+=closeC; return out; };
            auto multiline = [&](const std::vector<node_ptr>& elems, const char* openS, char closeC)->std::string {
                std::string out = std::string(openS) + "\n"; size_t i=0; for(auto &e: elems){
                    out += indentStr(indent + indentWidth) + pp(e.get(), indent + indentWidth);
                    if(++i<elems.size()) out += '\n';
                }
                out += '\n' + indentStr(indent) + closeC;
                return out;
            };
            auto all_atomic = [&](const std::vector<node_ptr>& elems){ for(auto &e: elems) if(e && !is_atomic(*e)) return false; return true; };

            if (std::holds_alternative<list>(x->data)) {
                const auto &elems = std::get<list>(x->data).elems;
                if (elems.empty()) return "()";
                bool forceMulti = false;
                if(elems[0] && std::holds_alternative<symbol>(elems[0]->data)){
                    static const char* defSyms[] = {"fn","defn","defn-","defmacro"};
                    const std::string &head = std::get<symbol>(elems[0]->data).name;
                    for(auto s: defSyms){ if(head==s){ forceMulti=true; break; } }
                }
                if(!forceMulti){
                    auto inlineForm = join_inline(elems,"(",')');
                    if(!inlineForm.empty() && (all_atomic(elems) || inlineForm.find('\n')==std::string::npos)) return inlineForm;
                }
                return multiline(elems,"(",')');
            }
            if (std::holds_alternative<vector_t>(x->data)) {
                const auto &elems = std::get<vector_t>(x->data).elems;
                if (elems.empty()) return "[]";
                auto inlineForm = join_inline(elems,"[",']');
                if(!inlineForm.empty() && inlineForm.find('\n')==std::string::npos) return inlineForm;
                return multiline(elems,"[",']');
            }
            if (std::holds_alternative<set>(x->data)) {
                const auto &elems = std::get<set>(x->data).elems;
                if (elems.empty()) return "#{}";
                auto inlineForm = join_inline(elems,"#{",'}');
                if(!inlineForm.empty() && inlineForm.find('\n')==std::string::npos) return inlineForm;
                return multiline(elems,"#{",'}');
            }
            if (std::holds_alternative<map>(x->data)) {
                const auto &entries = std::get<map>(x->data).entries; if(entries.empty()) return "{}";
                std::string inlineOut = "{"; bool first=true;
                for(auto &kv: entries){ if(!first) inlineOut+=' '; first=false; inlineOut+=pp(kv.first.get(), indent)+' '+pp(kv.second.get(), indent); if(inlineOut.size()>MAX_INLINE_LEN) { inlineOut.clear(); break; } }
                if(!inlineOut.empty() && inlineOut.find('\n')==std::string::npos){ inlineOut+='}'; return inlineOut; }
                std::string out="{\n"; size_t i=0; for(auto &kv: entries){ out += indentStr(indent+indentWidth)+pp(kv.first.get(), indent+indentWidth)+' '+pp(kv.second.get(), indent+indentWidth); if(++i<entries.size()) out+='\n'; }
                out += '\n'+indentStr(indent)+'}'; return out;
            }
            const auto &tv = std::get<tagged_value>(x->data);
            return std::string("#")+tv.tag.name+" "+pp(tv.inner.get(), indent);
        };
        return pp(&n, 0);
    }

} // namespace fnform
