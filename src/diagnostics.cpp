#include "formula/diagnostics.hpp"

namespace formula {

namespace {

void locate(const node& n, long& start, long& end){
    if(!n.span) return;
    start = static_cast<long>(n.span->start);
    end = static_cast<long>(n.span->end);
}

// The enclosing call of an empty argument, for the hint text.
const function_call* owning_call(const build_result& r, const node& placeholder){
    for(auto& n : r.nodes){
        auto* call = n->as<function_call>();
        if(!call) continue;
        for(auto& a : call->args) if(a.get() == &placeholder) return call;
        for(auto& a : call->named_args) if(a.get() == &placeholder) return call;
    }
    return nullptr;
}

} // namespace

DiagnosticsResult collect_diagnostics(const build_result& r){
    DiagnosticsResult out;
    for(auto& np : r.nodes){
        const node& n = *np;
        if(auto* err = n.as<error_node>()){
            FormulaError e;
            if(err->message == "Invalid number."){
                e.code = "E0101";
                e.hint = "use digits with an optional fraction and exponent";
            } else {
                e.code = "E0100";
                e.hint = "check the expression syntax near this position";
            }
            e.message = err->message;
            e.node = n.id;
            locate(n, e.start, e.end);
            out.errors.push_back(std::move(e));
        } else if(n.is<empty_argument>()){
            FormulaWarning w;
            w.code = "W0100";
            w.message = "missing argument";
            auto* call = owning_call(r, n);
            w.hint = (call && !call->name.empty()) ? "supply a value for this argument of '" + call->name + "'" : "supply a value for this argument";
            w.node = n.id;
            locate(n, w.start, w.end);
            out.warnings.push_back(std::move(w));
        }
    }
    out.success = out.errors.empty();
    return out;
}

} // namespace formula
