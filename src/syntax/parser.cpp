// parser.cpp - PEGTL front end. Parses formula text and reshapes the PEGTL parse tree
// into the CST the tree builder consumes (left-folded binary nodes, labelled parts).
#include "formula/parser.hpp"
#include "formula/tree_builder.hpp"
#include "grammar.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace formula {

namespace {

namespace pegtl = tao::pegtl;
namespace g = formula::syntax::grammar;
using pnode = pegtl::parse_tree::node;

template<typename Rule>
using selector = pegtl::parse_tree::selector< Rule,
    pegtl::parse_tree::store_content::on<
        g::name, g::comma, g::lparen, g::rparen, g::lbracket, g::rbracket, g::lbrace, g::rbrace, g::colon, g::dot,
        g::op_assign, g::op_pipe, g::op_or, g::op_and, g::op_eq, g::op_ne, g::op_le, g::op_lt, g::op_ge, g::op_gt,
        g::op_add, g::op_sub, g::op_mul, g::op_div, g::op_mod, g::op_pow, g::op_not, g::op_plus, g::op_minus,
        g::boolean_literal, g::float_literal, g::int_literal, g::string_literal, g::range_ref, g::cell_ref,
        g::group, g::sequence, g::array, g::object_entry, g::object, g::named_argument, g::arguments, g::call,
        g::member_suffix, g::index_suffix, g::postfix_expr, g::power_expr, g::prefix_expr,
        g::multiplicative_expr, g::additive_expr, g::relational_expr, g::equality_expr, g::and_expr, g::or_expr,
        g::pipe_expr, g::definition > >;

cst::node_ptr terminal(const pnode& n){
    return cst::make_terminal(n.begin().byte, n.string());
}

// CST kind of a binary operator token.
const char* binary_type(const pnode& op){
    if(op.is_type<g::op_pow>()) return "pow";
    if(op.is_type<g::op_mul>()) return "multiply";
    if(op.is_type<g::op_div>()) return "divide";
    if(op.is_type<g::op_mod>()) return "remainder";
    if(op.is_type<g::op_add>()) return "add";
    if(op.is_type<g::op_sub>()) return "subtract";
    if(op.is_type<g::op_lt>()) return "less";
    if(op.is_type<g::op_le>()) return "less_or_equal";
    if(op.is_type<g::op_gt>()) return "greater";
    if(op.is_type<g::op_ge>()) return "greater_or_equal";
    if(op.is_type<g::op_eq>()) return "equal";
    if(op.is_type<g::op_ne>()) return "not_equal";
    if(op.is_type<g::op_and>()) return "and";
    if(op.is_type<g::op_or>()) return "or";
    if(op.is_type<g::op_pipe>()) return "pipe";
    return "unknown_operator";
}

const char* prefix_type(const pnode& op){
    if(op.is_type<g::op_not>()) return "not";
    if(op.is_type<g::op_plus>()) return "positive";
    return "negative";
}

class cst_adapter {
public:
    cst::node_ptr convert(const pnode& n){
        if(is_binary_level(n)) return fold_binary(n);
        if(n.is_type<g::power_expr>()){
            auto base = convert(*n.children.at(0));
            if(n.children.size() < 3) return base;
            return cst::make_rule("pow", {base, terminal(*n.children[1]), convert(*n.children[2])});
        }
        if(n.is_type<g::prefix_expr>()){
            auto& op = *n.children.at(0);
            return cst::make_rule(prefix_type(op), {terminal(op), convert(*n.children.at(1))});
        }
        if(n.is_type<g::postfix_expr>()) return fold_postfix(n);
        if(n.is_type<g::definition>())
            return cst::make_rule("definition", {terminal(*n.children.at(0)), terminal(*n.children.at(1)), convert(*n.children.at(2))});
        if(n.is_type<g::group>())
            return cst::make_rule("group", {terminal(*n.children.at(0)), convert(*n.children.at(1)), terminal(*n.children.at(2))});
        if(n.is_type<g::name>()) return cst::make_rule("var", {terminal(n)});
        if(n.is_type<g::int_literal>()) return cst::make_rule("int", {terminal(n)});
        if(n.is_type<g::float_literal>()) return cst::make_rule("float", {terminal(n)});
        if(n.is_type<g::string_literal>()) return cst::make_rule("string", {terminal(n)});
        if(n.is_type<g::boolean_literal>()) return cst::make_rule("boolean", {terminal(n)});
        if(n.is_type<g::cell_ref>()) return cst::make_rule("cell", {terminal(n)});
        if(n.is_type<g::range_ref>()) return cst::make_rule("range", {terminal(n)});
        if(n.is_type<g::array>()) return convert_array(n);
        if(n.is_type<g::object>()) return convert_object(n);
        if(n.is_type<g::call>()) return convert_call(n);
        // Anything else is kept as an unknown rule so the builder recovers with an error node.
        std::vector<cst::node_ptr> kids;
        for(auto& c : n.children) kids.push_back(convert(*c));
        return n.children.empty() ? terminal(n) : cst::make_rule(std::string(n.type), std::move(kids));
    }

private:
    static bool is_binary_level(const pnode& n){
        return n.is_type<g::multiplicative_expr>() || n.is_type<g::additive_expr>() ||
               n.is_type<g::relational_expr>() || n.is_type<g::equality_expr>() ||
               n.is_type<g::and_expr>() || n.is_type<g::or_expr>() || n.is_type<g::pipe_expr>();
    }

    // [a, op, b, op, c] -> ((a op b) op c)
    cst::node_ptr fold_binary(const pnode& n){
        auto lhs = convert(*n.children.at(0));
        for(size_t i=1; i+1<n.children.size(); i+=2){
            auto& op = *n.children[i];
            lhs = cst::make_rule(binary_type(op), {lhs, terminal(op), convert(*n.children[i+1])});
        }
        return lhs;
    }

    cst::node_ptr fold_postfix(const pnode& n){
        auto base = convert(*n.children.at(0));
        for(size_t i=1; i<n.children.size(); ++i){
            auto& s = *n.children[i];
            if(s.is_type<g::member_suffix>()){
                base = cst::make_rule("select_id", {base, terminal(*s.children.at(0)), terminal(*s.children.at(1))});
            } else {
                base = cst::make_rule("select_expr", {base, terminal(*s.children.at(0)), convert(*s.children.at(1)), terminal(*s.children.at(2))});
            }
        }
        return base;
    }

    cst::node_ptr convert_array(const pnode& n){
        std::vector<cst::node_ptr> kids;
        for(auto& c : n.children){
            if(!c->is_type<g::sequence>()){ kids.push_back(terminal(*c)); continue; }
            std::vector<cst::node_ptr> seq_kids, items;
            for(auto& e : c->children){
                if(e->is_type<g::comma>()){ seq_kids.push_back(terminal(*e)); continue; }
                auto item = convert(*e);
                seq_kids.push_back(item);
                items.push_back(item);
            }
            auto seq = cst::make_rule("sequence", std::move(seq_kids));
            seq->fields["items"] = std::move(items);
            kids.push_back(seq);
        }
        return cst::make_rule("array", std::move(kids));
    }

    cst::node_ptr convert_object(const pnode& n){
        std::vector<cst::node_ptr> kids, keys, vals;
        for(auto& c : n.children){
            if(!c->is_type<g::object_entry>()){ kids.push_back(terminal(*c)); continue; }
            auto key = terminal(*c->children.at(0));
            auto val = convert(*c->children.at(2));
            kids.push_back(key);
            kids.push_back(terminal(*c->children.at(1)));
            kids.push_back(val);
            keys.push_back(key);
            vals.push_back(val);
        }
        auto obj = cst::make_rule("object", std::move(kids));
        obj->fields["keys"] = std::move(keys);
        obj->fields["vals"] = std::move(vals);
        return obj;
    }

    cst::node_ptr convert_call(const pnode& n){
        cst::node_ptr name, args_ctx;
        std::vector<cst::node_ptr> kids;
        for(auto& c : n.children){
            if(c->is_type<g::name>()){ name = terminal(*c); kids.push_back(name); continue; }
            if(!c->is_type<g::arguments>()){ kids.push_back(terminal(*c)); continue; }
            args_ctx = convert_arguments(*c);
            kids.push_back(args_ctx);
        }
        auto call = cst::make_rule("call", std::move(kids));
        if(name) call->fields["name"] = {name};
        if(args_ctx) call->fields["args"] = {args_ctx};
        return call;
    }

    // Positional items run up to the first named argument; the comma separating the two parts belongs to neither.
    cst::node_ptr convert_arguments(const pnode& n){
        std::vector<cst::node_ptr> items;
        size_t first_named = std::string::npos;
        for(auto& a : n.children){
            if(a->is_type<g::comma>()){ items.push_back(terminal(*a)); continue; }
            if(a->is_type<g::named_argument>()){
                if(first_named == std::string::npos) first_named = items.size();
                items.push_back(cst::make_rule("named-argument", {terminal(*a->children.at(0)), terminal(*a->children.at(1)), convert(*a->children.at(2))}));
                continue;
            }
            auto item = convert(*a);
            if(first_named != std::string::npos){
                auto misplaced = cst::make_rule("misplaced-argument", {item});
                misplaced->exception = "Positional argument after named arguments.";
                item = misplaced;
            }
            items.push_back(item);
        }
        auto ctx = cst::make_rule("call_arguments", items);
        if(first_named == std::string::npos){
            if(!items.empty()) ctx->fields["args"] = { cst::make_rule("argument_list", items) };
            return ctx;
        }
        std::vector<cst::node_ptr> positional(items.begin(), items.begin() + first_named);
        if(!positional.empty()){
            // slots are comma separated, so a non-empty positional part ends with the separator
            auto separator = positional.back();
            positional.pop_back();
            // f(, k = 1): the only positional slot is empty
            if(positional.empty()) positional.push_back(cst::make_rule("empty-argument", {separator}));
            ctx->fields["args"] = { cst::make_rule("argument_list", std::move(positional)) };
        }
        ctx->fields["namedArgs"] = { cst::make_rule("argument_list", std::vector<cst::node_ptr>(items.begin() + first_named, items.end())) };
        return ctx;
    }
};

} // namespace

cst::node_ptr parse(std::string_view src){
    return parse(src, detect_env());
}

cst::node_ptr parse(std::string_view src, const build_env& env){
    pegtl::memory_input in(src.data(), src.size(), "formula");
    try {
        auto root = pegtl::parse_tree::parse< g::evaluation, selector >(in);
        if(root && !root->children.empty()){
            cst_adapter adapter;
            auto cst_root = cst::make_rule("evaluation", {adapter.convert(*root->children.front())});
            detail::trace(env, "parse", "ok, " + std::to_string(src.size()) + " bytes");
            return cst_root;
        }
        auto err = std::make_shared<cst::node>();
        err->type = "error";
        err->exception = "Parser error.";
        detail::trace(env, "parse", "no parse tree produced");
        return cst::make_rule("evaluation", {err});
    } catch (const pegtl::parse_error& e) {
        auto err = std::make_shared<cst::node>();
        err->type = "error";
        err->exception = e.what();
        if(!src.empty()){
            size_t at = e.positions().empty() ? 0 : e.positions().front().byte;
            if(at >= src.size()) at = src.size() - 1;
            err->start = cst::symbol{at, at, std::string(1, src[at])};
        }
        detail::trace(env, "parse", std::string("error: ") + e.what());
        return cst::make_rule("evaluation", {err});
    }
}

build_result parse_formula(std::string_view src){
    auto env = detect_env();
    return build(parse(src, env), env);
}

build_result parse_formula(std::string_view src, const build_env& env){
    return build(parse(src, env), env);
}

} // namespace formula
