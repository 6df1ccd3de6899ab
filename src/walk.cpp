#include "formula/walk.hpp"
#include <type_traits>

namespace formula {

namespace {

template<typename F>
void for_each_child(const node& n, const walk_options& opts, F&& f){
    std::visit([&](auto&& arg){
        using T = std::decay_t<decltype(arg)>;
        if constexpr(std::is_same_v<T,definition>){ f(arg.expr); }
        else if constexpr(std::is_same_v<T,function_call>){
            for(auto& a : arg.args) f(a);
            if(opts.named_arguments) for(auto& a : arg.named_args) f(a);
        }
        else if constexpr(std::is_same_v<T,array>){ for(auto& v : arg.values) f(v); }
        else if constexpr(std::is_same_v<T,object>){ for(auto& e : arg.entries) f(e.value); }
        else if constexpr(std::is_same_v<T,pipe_op>){ f(arg.left); f(arg.right); }
        else if constexpr(std::is_same_v<T,named_argument>){ if(opts.named_arguments) f(arg.value); }
        // literals, references, empty arguments and errors are leaves
    }, n.data);
}

void walk_impl(const node_ptr& n, const visit_fn& visit, const walk_options& opts){
    if(!n) return;
    visit(*n);
    for_each_child(*n, opts, [&](const node_ptr& c){ walk_impl(c, visit, opts); });
}

} // namespace

void walk(const node_ptr& root, const visit_fn& visit, const walk_options& opts){
    walk_impl(root, visit, opts);
}

std::vector<node_ptr> children_of(const node& n, const walk_options& opts){
    std::vector<node_ptr> out;
    for_each_child(n, opts, [&](const node_ptr& c){ if(c) out.push_back(c); });
    return out;
}

} // namespace formula
