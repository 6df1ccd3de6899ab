#include "formula/diagnostics_json.hpp"
#include <cstdio>

namespace formula {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        auto u = static_cast<unsigned char>(c);
        if(c == '"') out += "\\\"";
        else if(c == '\\') out += "\\\\";
        else if(c == '\n') out += "\\n";
        else if(c == '\r') out += "\\r";
        else if(c == '\t') out += "\\t";
        else if(u < 0x20){
            static const char hex[] = "0123456789ABCDEF";
            out += "\\u00";
            out += hex[u >> 4];
            out += hex[u & 0xF];
        }
        else out += c;
    }
    out += '"';
    return out;
}

namespace {

template<typename D>
void append_entry(std::string& out, const D& d){
    out += "{\"code\":" + json_escape(d.code);
    out += ",\"message\":" + json_escape(d.message);
    out += ",\"hint\":" + json_escape(d.hint);
    out += ",\"node\":" + std::to_string(d.node);
    out += ",\"start\":" + std::to_string(d.start);
    out += ",\"end\":" + std::to_string(d.end);
    out += '}';
}

template<typename D>
void append_list(std::string& out, const char* key, const std::vector<D>& items){
    out += '"';
    out += key;
    out += "\":[";
    for(size_t i=0; i<items.size(); ++i){
        if(i) out += ',';
        append_entry(out, items[i]);
    }
    out += ']';
}

} // namespace

std::string diagnostics_to_json(const DiagnosticsResult& r){
    std::string out = "{\"success\":";
    out += r.success ? "true" : "false";
    out += ',';
    append_list(out, "errors", r.errors);
    out += ',';
    append_list(out, "warnings", r.warnings);
    out += '}';
    return out;
}

void maybe_print_json(const DiagnosticsResult& r, const build_env& env){
    if(!env.diag_json) return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(r).c_str());
}

} // namespace formula
