// tree_builder.cpp - maps the grammar's concrete syntax tree onto the formula AST
#include "formula/tree_builder.hpp"
#include "formula/address.hpp"
#include "formula/diagnostics_json.hpp"

#include <stdexcept>
#include <string_view>
#include <unordered_map>

namespace formula {

namespace {

// CST rule kinds the builder understands. Anything else recovers to an error node.
enum class cst_kind {
    Evaluation, Simple, Group,
    Definition,
    SelectId, SelectExpr,
    Unary,
    Binary,
    Pipe,
    Number,
    Boolean,
    String,
    Array,
    Object,
    Var,
    Cell,
    Range,
    CallAlias,
    Call,
    NamedArgument,
    EmptyArgument,
    Unknown
};

cst_kind classify(const std::string& type){
    static const std::unordered_map<std::string_view, cst_kind> table = {
        {"evaluation", cst_kind::Evaluation}, {"simple", cst_kind::Simple}, {"group", cst_kind::Group},
        {"definition", cst_kind::Definition},
        {"select_id", cst_kind::SelectId}, {"select_expr", cst_kind::SelectExpr},
        {"not", cst_kind::Unary}, {"positive", cst_kind::Unary}, {"negative", cst_kind::Unary},
        // binary operators, tightest first
        {"pow", cst_kind::Binary},
        {"multiply", cst_kind::Binary}, {"divide", cst_kind::Binary}, {"remainder", cst_kind::Binary},
        {"add", cst_kind::Binary}, {"subtract", cst_kind::Binary},
        {"less", cst_kind::Binary}, {"less_or_equal", cst_kind::Binary},
        {"greater", cst_kind::Binary}, {"greater_or_equal", cst_kind::Binary},
        {"equal", cst_kind::Binary}, {"not_equal", cst_kind::Binary},
        {"and", cst_kind::Binary}, {"or", cst_kind::Binary},
        {"pipe", cst_kind::Pipe},
        {"int", cst_kind::Number}, {"float", cst_kind::Number}, {"number", cst_kind::Number},
        {"boolean", cst_kind::Boolean},
        {"string", cst_kind::String},
        {"array", cst_kind::Array},
        {"object", cst_kind::Object},
        {"var", cst_kind::Var},
        {"cell", cst_kind::Cell},
        {"range", cst_kind::Range},
        {"_call", cst_kind::CallAlias},
        {"call", cst_kind::Call},
        {"named-argument", cst_kind::NamedArgument},
        {"empty-argument", cst_kind::EmptyArgument},
    };
    auto it = table.find(type);
    return it == table.end() ? cst_kind::Unknown : it->second;
}

cst::node_ptr child(const cst::node& n, size_t i){
    return i < n.children.size() ? n.children[i] : nullptr;
}

// Token source for a node: its own symbol for terminals, its first token otherwise.
const std::optional<cst::symbol>& token_symbol(const cst::node& n){
    return n.sym ? n.sym : n.start;
}

bool is_comma(const cst::node_ptr& n){ return n && n->text() == ","; }

// Per-build state: id counter and side tables. One instance per build() call.
class tree_builder {
public:
    build_result run(const cst::node_ptr& root){
        out_.root = from_cst(root);
        return std::move(out_);
    }

private:
    build_result out_;
    node_id next_id_ = 0;

    // Ids are handed out when a node is created, i.e. after its children exist.
    node_ptr emit(std::optional<source_span> span, node_data data){
        auto n = std::make_shared<node>();
        n->id = next_id_++;
        n->span = span;
        n->data = std::move(data);
        out_.nodes.push_back(n);
        return n;
    }

    void push_token(token_kind kind, const std::optional<cst::symbol>& sym){
        out_.tokens.push_back(make_token(kind, sym));
    }

    node_ptr parser_error(std::optional<source_span> span){
        return emit(span, error_node{"Parser error."});
    }

    std::vector<node_ptr> expr_sequence(const std::vector<cst::node_ptr>* items){
        std::vector<node_ptr> out;
        if(!items) return out;
        for(auto& c : *items) out.push_back(from_cst(c));
        return out;
    }

    // Raw argument list: items interleaved with commas. Omitted arguments become
    // empty_argument placeholders so positions stay stable in partial input like sum(x,,y).
    std::vector<node_ptr> arg_sequence(const cst::node_ptr& list){
        std::vector<node_ptr> out;
        if(!list) return out;
        const auto& items = list->children;
        bool after_arg = false;
        for(auto& it : items){
            if(is_comma(it)){
                if(!after_arg) out.push_back(emit(span_of(*it), empty_argument{}));
                after_arg = false;
            } else {
                out.push_back(from_cst(it));
                after_arg = true;
            }
        }
        if(!after_arg && !items.empty() && is_comma(items.back()))
            out.push_back(emit(span_of(*items.back()), empty_argument{}));
        return out;
    }

    node_ptr build_number(const cst::node& n, std::optional<source_span> span){
        auto tok = child(n, 0);
        if(n.children.size() != 1 || !tok) return emit(span, error_node{"Invalid number."});
        std::string text = tok->text();
        double value = 0;
        try {
            size_t used = 0;
            value = std::stod(text, &used);
            if(used != text.size()) return emit(span, error_node{"Invalid number."});
        } catch(const std::invalid_argument&) {
            return emit(span, error_node{"Invalid number."});
        } catch(const std::out_of_range&) {
            return emit(span, error_node{"Invalid number."});
        }
        push_token(token_kind::NumberLiteral, token_symbol(*tok));
        return emit(span, number_literal{value});
    }

    node_ptr build_call(const cst::node& n, std::optional<source_span> span){
        auto name_tok = n.field_one("name");
        std::string name = name_tok ? name_tok->text() : std::string();
        if(name_tok) push_token(token_kind::FunctionName, token_symbol(*name_tok));
        function_call call{std::move(name), {}, {}};
        if(auto args_ctx = n.field_one("args")){
            call.args = arg_sequence(args_ctx->field_one("args"));
            call.named_args = arg_sequence(args_ctx->field_one("namedArgs"));
        }
        return emit(span, std::move(call));
    }

    node_ptr build_object(const cst::node& n, std::optional<source_span> span){
        static const std::vector<cst::node_ptr> none;
        const auto* keys = n.field("keys");
        const auto* vals = n.field("vals");
        if(!keys) keys = &none;
        if(!vals) vals = &none;
        object obj;
        for(size_t i=0; i<keys->size(); ++i){
            auto& key = (*keys)[i];
            auto val = i < vals->size() ? (*vals)[i] : nullptr;
            if(!key) continue;
            push_token(token_kind::Key, token_symbol(*key));
            if(val) obj.entries.push_back(object_entry{key->text(), from_cst(val)});
        }
        return emit(span, std::move(obj));
    }

    node_ptr from_cst(const cst::node_ptr& np){
        if(!np) return parser_error(std::nullopt);
        const cst::node& n = *np;
        auto span = span_of(n);
        switch(classify(n.type)){
        case cst_kind::Evaluation:
        case cst_kind::Simple:
            return from_cst(child(n, 0));
        case cst_kind::Group:
            return from_cst(child(n, 1));
        case cst_kind::Definition: {
            auto lhs = child(n, 0);
            if(!lhs) return parser_error(span);
            push_token(token_kind::OutputName, token_symbol(*lhs));
            auto expr = from_cst(child(n, 2));
            return emit(span, definition{lhs->text(), expr});
        }
        case cst_kind::SelectId: {
            auto value = from_cst(child(n, 0));
            auto member = child(n, 2);
            auto id = emit(member ? span_of(*member) : span, string_literal{member ? member->text() : std::string()});
            return emit(span, function_call{"select", {value, id}, {}});
        }
        case cst_kind::SelectExpr: {
            auto value = from_cst(child(n, 0));
            auto index = from_cst(child(n, 2));
            return emit(span, function_call{"select", {value, index}, {}});
        }
        case cst_kind::Unary: {
            auto operand = from_cst(child(n, 1));
            return emit(span, function_call{n.type, {operand}, {}});
        }
        case cst_kind::Binary: {
            auto lhs = from_cst(child(n, 0));
            auto rhs = from_cst(child(n, 2));
            return emit(span, function_call{n.type, {lhs, rhs}, {}});
        }
        case cst_kind::Pipe: {
            auto lhs = from_cst(child(n, 0));
            auto rhs = from_cst(child(n, 2));
            return emit(span, pipe_op{lhs, rhs});
        }
        case cst_kind::Number:
            return build_number(n, span);
        case cst_kind::Boolean: {
            auto tok = child(n, 0);
            if(!tok) return parser_error(span);
            push_token(token_kind::BooleanLiteral, token_symbol(*tok));
            return emit(span, boolean_literal{tok->text() == "true"});
        }
        case cst_kind::String: {
            auto tok = child(n, 0);
            if(!tok) return parser_error(span);
            push_token(token_kind::StringLiteral, token_symbol(*tok));
            std::string raw = tok->text();
            std::string value = raw.size() >= 2 ? raw.substr(1, raw.size()-2) : std::string();
            return emit(span, string_literal{std::move(value)});
        }
        case cst_kind::Array: {
            auto seq = child(n, 1);
            std::vector<node_ptr> values;
            if(seq) values = expr_sequence(seq->field("items"));
            return emit(span, array{std::move(values)});
        }
        case cst_kind::Object:
            return build_object(n, span);
        case cst_kind::Var: {
            std::string name = n.text();
            auto first = n.start ? n.start : n.sym;
            auto last = n.stop ? n.stop : first;
            if(!first) return parser_error(span);
            push_token(token_kind::InputVariableName, cst::symbol{first->start, last->stop, name});
            auto v = emit(span, var{std::move(name)});
            out_.inputs.push_back(v);
            return v;
        }
        case cst_kind::Cell: {
            std::string text = n.text();
            if(!is_cell_name(text)) return parser_error(span);
            auto a = parse_cell(text);
            auto c = emit(span, cell_ref{a.row, a.col});
            out_.inputs.push_back(c);
            return c;
        }
        case cst_kind::Range: {
            std::string text = n.text();
            if(!is_range_name(text)) return parser_error(span);
            auto a = parse_range(text);
            auto r = emit(span, range_ref{a.start_row, a.start_col, a.end_row, a.end_col});
            out_.inputs.push_back(r);
            return r;
        }
        case cst_kind::CallAlias: {
            auto inner = child(n, 0);
            if(!inner) return parser_error(span);
            return build_call(*inner, span_of(*inner));
        }
        case cst_kind::Call:
            return build_call(n, span);
        case cst_kind::NamedArgument: {
            auto name = child(n, 0);
            if(!name) return parser_error(span);
            push_token(token_kind::Key, token_symbol(*name));
            auto value = from_cst(child(n, 2));
            return emit(span, named_argument{name->text(), value});
        }
        case cst_kind::EmptyArgument:
            return emit(span, empty_argument{});
        case cst_kind::Unknown:
            break;
        }
        if(n.exception) return emit(span, error_node{*n.exception});
        return parser_error(span);
    }
};

} // namespace

std::optional<source_span> span_of(const cst::node& n){
    if(n.start){
        if(n.stop) return source_span{n.start->start, n.stop->stop + 1};
        return source_span{n.start->start, n.start->stop + 1};
    }
    if(n.sym) return source_span{n.sym->start, n.sym->stop + 1};
    return std::nullopt;
}

token make_token(token_kind kind, const std::optional<cst::symbol>& sym){
    if(!sym) throw std::invalid_argument("Illegal argument: token requires a source symbol");
    if(sym->stop + 1 < sym->start) throw std::invalid_argument("Illegal argument: token stop precedes start");
    // symbol stop is inclusive
    return token{kind, sym->start, sym->stop + 1, sym->text};
}

build_result build(const cst::node_ptr& root){
    return build(root, detect_env());
}

build_result build(const cst::node_ptr& root, const build_env& env){
    tree_builder b;
    auto result = b.run(root);
    detail::trace(env, "build", std::to_string(result.nodes.size()) + " nodes, " +
        std::to_string(result.inputs.size()) + " inputs, " + std::to_string(result.tokens.size()) + " tokens");
    if(env.diag_json) maybe_print_json(collect_diagnostics(result), env);
    return result;
}

} // namespace formula
