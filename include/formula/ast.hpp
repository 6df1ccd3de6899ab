// Typed abstract syntax tree for formulas, plus the side tables produced by a build.
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace formula
{

    using node_id = std::uint32_t;

    // Half-open source range [start, end).
    struct source_span
    {
        std::size_t start = 0;
        std::size_t end = 0;
    };

    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct number_literal
    {
        double value = 0;
    };
    struct string_literal
    {
        std::string value;
    };
    struct boolean_literal
    {
        bool value = false;
    };
    struct var
    {
        std::string name;
    };
    struct cell_ref
    {
        std::uint32_t row = 0;
        std::uint32_t col = 0;
    };
    struct range_ref
    {
        std::uint32_t start_row = 0;
        std::uint32_t start_col = 0;
        std::uint32_t end_row = 0;
        std::uint32_t end_col = 0;
    };
    struct array
    {
        std::vector<node_ptr> values;
    };
    struct object_entry
    {
        std::string key;
        node_ptr value;
    };
    struct object
    {
        std::vector<object_entry> entries;
    };
    // Operators and member selection are lowered to calls with reserved names.
    // named_args holds named_argument nodes, empty_argument placeholders for stray commas,
    // and error nodes for positional arguments written after a named one.
    struct function_call
    {
        std::string name;
        std::vector<node_ptr> args;
        std::vector<node_ptr> named_args;
    };
    struct named_argument
    {
        std::string name;
        node_ptr value;
    };
    struct empty_argument
    {
    };
    struct definition
    {
        std::string name;
        node_ptr expr;
    };
    struct pipe_op
    {
        node_ptr left;
        node_ptr right;
    };
    struct error_node
    {
        std::string message;
    };

    using node_data = std::variant<number_literal, string_literal, boolean_literal, var, cell_ref, range_ref,
                                   array, object, function_call, named_argument, empty_argument, definition,
                                   pipe_op, error_node>;

    // Order matches the alternatives of node_data.
    enum class node_kind
    {
        Number,
        String,
        Boolean,
        Var,
        Cell,
        Range,
        Array,
        Object,
        Call,
        NamedArgument,
        EmptyArgument,
        Definition,
        Pipe,
        Error
    };

    struct node
    {
        node_id id = 0;
        std::optional<source_span> span; // absent when the CST carried no position
        node_data data;

        node_kind kind() const { return static_cast<node_kind>(data.index()); }
        template <typename T>
        bool is() const { return std::holds_alternative<T>(data); }
        template <typename T>
        const T *as() const { return std::get_if<T>(&data); }
    };

    // Stable textual name of a kind ("number", "call", "named-argument", ...).
    const char *kind_name(node_kind k);
    inline const char *kind_name(const node &n) { return kind_name(n.kind()); }

    // Reference kinds feed dependency analysis.
    inline bool is_reference(const node &n) { return n.is<var>() || n.is<cell_ref>() || n.is<range_ref>(); }

    // ------ highlighting tokens ------

    enum class token_kind
    {
        OutputName,
        NumberLiteral,
        BooleanLiteral,
        StringLiteral,
        Key,
        InputVariableName,
        FunctionName
    };

    const char *token_kind_name(token_kind k);

    struct token
    {
        token_kind kind;
        std::size_t start = 0;
        std::size_t end = 0; // exclusive
        std::string text;
    };

    // Everything one build produces. Owned by the caller, never mutated by the library afterwards.
    struct build_result
    {
        node_ptr root;
        std::vector<node_ptr> nodes;  // creation order
        std::vector<node_ptr> inputs; // var / cell / range nodes in creation order
        std::vector<token> tokens;    // source order
    };

    // Compact prefix rendering, e.g. (add (add 1 x) A1).
    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }

} // namespace formula
