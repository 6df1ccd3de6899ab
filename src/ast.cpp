// ast.cpp - kind names and the compact printer
#include "formula/ast.hpp"
#include "formula/address.hpp"
#include "formula/diagnostics_json.hpp"

#include <sstream>
#include <type_traits>

namespace formula
{

    const char *kind_name(node_kind k)
    {
        switch (k)
        {
        case node_kind::Number:
            return "number";
        case node_kind::String:
            return "string";
        case node_kind::Boolean:
            return "boolean";
        case node_kind::Var:
            return "var";
        case node_kind::Cell:
            return "cell";
        case node_kind::Range:
            return "range";
        case node_kind::Array:
            return "array";
        case node_kind::Object:
            return "object";
        case node_kind::Call:
            return "call";
        case node_kind::NamedArgument:
            return "named-argument";
        case node_kind::EmptyArgument:
            return "empty-argument";
        case node_kind::Definition:
            return "definition";
        case node_kind::Pipe:
            return "pipe";
        case node_kind::Error:
            return "error";
        }
        return "unknown";
    }

    const char *token_kind_name(token_kind k)
    {
        switch (k)
        {
        case token_kind::OutputName:
            return "output-name";
        case token_kind::NumberLiteral:
            return "number-literal";
        case token_kind::BooleanLiteral:
            return "boolean-literal";
        case token_kind::StringLiteral:
            return "string-literal";
        case token_kind::Key:
            return "key";
        case token_kind::InputVariableName:
            return "input-variable-name";
        case token_kind::FunctionName:
            return "function-name";
        }
        return "unknown";
    }

    std::string to_string(const node &n)
    {
        struct V
        {
            std::string operator()(const number_literal &x) const
            {
                std::ostringstream oss;
                oss << x.value;
                return oss.str();
            }
            std::string operator()(const string_literal &x) const { return json_escape(x.value); }
            std::string operator()(const boolean_literal &x) const { return x.value ? "true" : "false"; }
            std::string operator()(const var &x) const { return x.name; }
            std::string operator()(const cell_ref &x) const { return cell_name(x.row, x.col); }
            std::string operator()(const range_ref &x) const
            {
                return range_name(range_address{x.start_row, x.start_col, x.end_row, x.end_col});
            }
            std::string operator()(const array &x) const
            {
                std::string out = "[";
                bool first = true;
                for (auto &v : x.values)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(v);
                }
                out += ']';
                return out;
            }
            std::string operator()(const object &x) const
            {
                std::string out = "{";
                bool first = true;
                for (auto &e : x.entries)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += e.key + ": " + to_string(e.value);
                }
                out += '}';
                return out;
            }
            std::string operator()(const function_call &x) const
            {
                std::string out = "(" + x.name;
                for (auto &a : x.args)
                    out += ' ' + to_string(a);
                for (auto &a : x.named_args)
                    out += ' ' + to_string(a);
                out += ')';
                return out;
            }
            std::string operator()(const named_argument &x) const { return ':' + x.name + ' ' + to_string(x.value); }
            std::string operator()(const empty_argument &) const { return "_"; }
            std::string operator()(const definition &x) const { return "(= " + x.name + ' ' + to_string(x.expr) + ')'; }
            std::string operator()(const pipe_op &x) const
            {
                return "(| " + to_string(x.left) + ' ' + to_string(x.right) + ')';
            }
            std::string operator()(const error_node &x) const { return "#error " + json_escape(x.message); }
        };
        return std::visit(V{}, n.data);
    }

} // namespace formula
