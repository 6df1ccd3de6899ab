#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "formula/parser.hpp"
#include "formula/tree_builder.hpp"

using namespace formula;
using cst::make_rule;
using cst::make_terminal;

namespace {

build_env quiet{};

cst::node_ptr num(size_t at, const std::string& text){ return make_rule("int", {make_terminal(at, text)}); }
cst::node_ptr name_ref(size_t at, const std::string& text){ return make_rule("var", {make_terminal(at, text)}); }

// f() at offset 0, optionally without its name label.
cst::node_ptr bare_call(bool named){
    auto name = make_terminal(0, "f");
    auto call = make_rule("call", {name, make_terminal(1, "("), make_terminal(2, ")")});
    if(named) call->fields["name"] = {name};
    return call;
}

} // namespace

TEST(TreeBuilder, CallAliasUnwrapsInnerCall){
    auto r = build(make_rule("_call", {bare_call(true)}), quiet);
    auto* call = r.root->as<function_call>();
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "f");
    EXPECT_TRUE(call->args.empty());
    EXPECT_EQ(r.root->span->start, 0u);
    EXPECT_EQ(r.root->span->end, 3u);
    ASSERT_EQ(r.tokens.size(), 1u);
    EXPECT_EQ(r.tokens[0].kind, token_kind::FunctionName);
}

TEST(TreeBuilder, AnonymousCall){
    auto r = build(bare_call(false), quiet);
    auto* call = r.root->as<function_call>();
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "");
    EXPECT_TRUE(r.tokens.empty());
}

TEST(TreeBuilder, ObjectWithMissingValue){
    auto k1 = make_terminal(1, "a");
    auto v1 = num(4, "1");
    auto k2 = make_terminal(7, "b");
    auto obj = make_rule("object", {make_terminal(0, "{"), k1, make_terminal(2, ":"), v1, make_terminal(5, ","),
                                    k2, make_terminal(8, ":"), make_terminal(10, "}")});
    obj->fields["keys"] = {k1, k2};
    obj->fields["vals"] = {v1};
    auto r = build(obj, quiet);
    auto* o = r.root->as<object>();
    ASSERT_NE(o, nullptr);
    ASSERT_EQ(o->entries.size(), 1u);
    EXPECT_EQ(o->entries[0].key, "a");
    // both keys are highlighted
    ASSERT_EQ(r.tokens.size(), 3u);
    EXPECT_EQ(r.tokens[0].kind, token_kind::Key);
    EXPECT_EQ(r.tokens[1].kind, token_kind::NumberLiteral);
    EXPECT_EQ(r.tokens[2].kind, token_kind::Key);
    EXPECT_EQ(r.tokens[2].text, "b");
}

TEST(TreeBuilder, ObjectWithNullKey){
    auto v1 = num(3, "1");
    auto k2 = make_terminal(6, "b");
    auto v2 = num(9, "2");
    auto obj = make_rule("object", {make_terminal(0, "{"), v1, k2, v2, make_terminal(10, "}")});
    obj->fields["keys"] = {nullptr, k2};
    obj->fields["vals"] = {v1, v2};
    auto r = build(obj, quiet);
    auto* o = r.root->as<object>();
    ASSERT_EQ(o->entries.size(), 1u);
    EXPECT_EQ(o->entries[0].key, "b");
    EXPECT_DOUBLE_EQ(o->entries[0].value->as<number_literal>()->value, 2);
}

TEST(TreeBuilder, InvalidNumber){
    auto r = build(num(0, "1x"), quiet);
    ASSERT_TRUE(r.root->is<error_node>());
    EXPECT_EQ(r.root->as<error_node>()->message, "Invalid number.");
    EXPECT_TRUE(r.tokens.empty());

    auto two = make_rule("float", {make_terminal(0, "1"), make_terminal(1, "2")});
    EXPECT_EQ(build(two, quiet).root->as<error_node>()->message, "Invalid number.");

    auto huge = build(num(0, "1e999"), quiet);
    EXPECT_EQ(huge.root->as<error_node>()->message, "Invalid number.");
}

TEST(TreeBuilder, UnknownRuleRecovers){
    auto odd = make_rule("mystery", {make_terminal(0, "?")});
    auto r = build(odd, quiet);
    ASSERT_TRUE(r.root->is<error_node>());
    EXPECT_EQ(r.root->as<error_node>()->message, "Parser error.");
    EXPECT_EQ(r.root->span->start, 0u);
    EXPECT_EQ(r.root->span->end, 1u);

    odd->exception = "no viable alternative";
    EXPECT_EQ(build(odd, quiet).root->as<error_node>()->message, "no viable alternative");
}

TEST(TreeBuilder, NullRootAndEmptyEvaluation){
    auto r = build(nullptr, quiet);
    ASSERT_TRUE(r.root->is<error_node>());
    EXPECT_FALSE(r.root->span.has_value());
    ASSERT_EQ(r.nodes.size(), 1u);

    auto empty = build(make_rule("evaluation", {}), quiet);
    ASSERT_TRUE(empty.root->is<error_node>());
    EXPECT_FALSE(empty.root->span.has_value());
}

TEST(TreeBuilder, MissingSpan){
    auto r = build(make_rule("boolean", {}), quiet);
    ASSERT_TRUE(r.root->is<error_node>());
    EXPECT_FALSE(r.root->span.has_value());
}

TEST(TreeBuilder, MalformedAddressesRecover){
    auto cell = build(make_rule("cell", {make_terminal(0, "A0")}), quiet);
    EXPECT_TRUE(cell.root->is<error_node>());
    EXPECT_TRUE(cell.inputs.empty());
    auto range = build(make_rule("range", {make_terminal(0, "A1:9")}), quiet);
    EXPECT_TRUE(range.root->is<error_node>());
}

TEST(TreeBuilder, OutOfRangeAddressesRecover){
    for(const char* text : {"A4294967297", "AAAAAAAAA1", "B123456789012"}){
        auto r = build(make_rule("cell", {make_terminal(0, text)}), quiet);
        ASSERT_TRUE(r.root->is<error_node>()) << text;
        EXPECT_EQ(r.root->as<error_node>()->message, "Parser error.");
        EXPECT_TRUE(r.inputs.empty()) << text;
    }
    auto range = build(make_rule("range", {make_terminal(0, "A1:A4294967297")}), quiet);
    EXPECT_TRUE(range.root->is<error_node>());
    EXPECT_TRUE(range.inputs.empty());

    auto last_row = build(make_rule("cell", {make_terminal(0, "A4294967296")}), quiet);
    ASSERT_TRUE(last_row.root->is<cell_ref>());
    EXPECT_EQ(last_row.root->as<cell_ref>()->row, 4294967295u);
}

TEST(TreeBuilder, DefinitionWithoutName){
    auto def = make_rule("definition", {nullptr, make_terminal(2, "="), num(4, "1")});
    auto r = build(def, quiet);
    ASSERT_TRUE(r.root->is<error_node>());
    EXPECT_EQ(r.root->span->start, 2u);
}

TEST(TreeBuilder, TokenRequiresSymbol){
    EXPECT_THROW(make_token(token_kind::Key, std::nullopt), std::invalid_argument);
    EXPECT_THROW(make_token(token_kind::Key, cst::symbol{5, 2, "x"}), std::invalid_argument);
    auto t = make_token(token_kind::Key, cst::symbol{3, 2, ""});
    EXPECT_EQ(t.start, 3u);
    EXPECT_EQ(t.end, 3u);
    auto k = make_token(token_kind::StringLiteral, cst::symbol{4, 8, "\"abc\""});
    EXPECT_EQ(k.start, 4u);
    EXPECT_EQ(k.end, 9u);
    EXPECT_EQ(k.text, "\"abc\"");
}

TEST(TreeBuilder, TokenWithoutSymbolThrowsFromBuild){
    // a string rule whose only child carries no position
    auto s = make_rule("string", {make_rule("quoted", {})});
    EXPECT_THROW(build(s, quiet), std::invalid_argument);
}

TEST(TreeBuilder, SpanOf){
    cst::node both;
    both.start = cst::symbol{2, 3, "ab"};
    both.stop = cst::symbol{7, 9, "xyz"};
    auto s = span_of(both);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->start, 2u);
    EXPECT_EQ(s->end, 10u);

    cst::node start_only;
    start_only.start = cst::symbol{4, 5, "ab"};
    EXPECT_EQ(span_of(start_only)->end, 6u);

    auto term = make_terminal(3, "abc");
    EXPECT_EQ(span_of(*term)->start, 3u);
    EXPECT_EQ(span_of(*term)->end, 6u);

    cst::node none;
    EXPECT_FALSE(span_of(none).has_value());
}

TEST(TreeBuilder, IdsArePostOrderAndDense){
    auto r = parse_formula("x = f(1 + 2, y)", quiet);
    for(size_t i=0; i<r.nodes.size(); ++i) EXPECT_EQ(r.nodes[i]->id, i);
    EXPECT_EQ(r.root->id, r.nodes.size() - 1);
    // children are created before their parent
    auto* add = r.root->as<definition>()->expr->as<function_call>()->args[0].get();
    auto* add_call = add->as<function_call>();
    ASSERT_NE(add_call, nullptr);
    EXPECT_LT(add_call->args[0]->id, add->id);
    EXPECT_LT(add_call->args[1]->id, add->id);
}

TEST(TreeBuilder, BuildsAreIndependent){
    auto root = parse("a + 1", quiet);
    auto first = build(root, quiet);
    auto second = build(root, quiet);
    EXPECT_EQ(first.root->id, second.root->id);
    EXPECT_EQ(first.nodes.size(), second.nodes.size());
    EXPECT_NE(first.root.get(), second.root.get());
    EXPECT_EQ(first.nodes.front()->id, 0u);
    EXPECT_EQ(second.nodes.front()->id, 0u);
}

TEST(TreeBuilder, GroupIsTransparent){
    auto g = make_rule("group", {make_terminal(0, "("), name_ref(1, "a"), make_terminal(2, ")")});
    auto r = build(g, quiet);
    ASSERT_TRUE(r.root->is<var>());
    EXPECT_EQ(r.root->span->start, 1u);
    EXPECT_EQ(r.nodes.size(), 1u);
}

TEST(TreeBuilder, SimpleAndNumberKinds){
    auto r = build(make_rule("simple", {make_rule("number", {make_terminal(0, "2.5")})}), quiet);
    ASSERT_TRUE(r.root->is<number_literal>());
    EXPECT_DOUBLE_EQ(r.root->as<number_literal>()->value, 2.5);
    EXPECT_EQ(r.nodes.size(), 1u);
}

TEST(TreeBuilder, SelectIdUsesMemberSpan){
    auto sel = make_rule("select_id", {name_ref(0, "obj"), make_terminal(3, "."), make_terminal(4, "field")});
    auto r = build(sel, quiet);
    auto* call = r.root->as<function_call>();
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "select");
    auto& member = call->args[1];
    EXPECT_EQ(member->as<string_literal>()->value, "field");
    EXPECT_EQ(member->span->start, 4u);
    EXPECT_EQ(member->span->end, 9u);
    EXPECT_EQ(r.root->span->end, 9u);
}

TEST(TreeBuilder, UnaryOperators){
    for(const char* op : {"not", "positive", "negative"}){
        auto u = make_rule(op, {make_terminal(0, "-"), name_ref(1, "a")});
        auto r = build(u, quiet);
        auto* call = r.root->as<function_call>();
        ASSERT_NE(call, nullptr) << op;
        EXPECT_EQ(call->name, op);
        ASSERT_EQ(call->args.size(), 1u);
        EXPECT_TRUE(call->args[0]->is<var>());
    }
}

TEST(TreeBuilder, BinaryOperatorTable){
    const char* ops[] = {"pow", "multiply", "divide", "remainder", "add", "subtract", "less", "less_or_equal",
                         "greater", "greater_or_equal", "equal", "not_equal", "and", "or"};
    for(auto op : ops){
        auto b = make_rule(op, {num(0, "1"), make_terminal(2, "?"), num(4, "2")});
        auto r = build(b, quiet);
        auto* call = r.root->as<function_call>();
        ASSERT_NE(call, nullptr) << op;
        EXPECT_EQ(call->name, op);
        ASSERT_EQ(call->args.size(), 2u);
        EXPECT_DOUBLE_EQ(call->args[0]->as<number_literal>()->value, 1);
        EXPECT_DOUBLE_EQ(call->args[1]->as<number_literal>()->value, 2);
    }
    auto p = build(make_rule("pipe", {name_ref(0, "a"), make_terminal(2, "|"), name_ref(4, "b")}), quiet);
    ASSERT_TRUE(p.root->is<pipe_op>());
    EXPECT_EQ(p.root->as<pipe_op>()->right->as<var>()->name, "b");
}

TEST(TreeBuilder, InputsInCreationOrder){
    auto r = parse_formula("f(b, A1, [c], {k: B1:B2})", quiet);
    ASSERT_EQ(r.inputs.size(), 4u);
    EXPECT_EQ(r.inputs[0]->as<var>()->name, "b");
    EXPECT_TRUE(r.inputs[1]->is<cell_ref>());
    EXPECT_EQ(r.inputs[2]->as<var>()->name, "c");
    EXPECT_TRUE(r.inputs[3]->is<range_ref>());
    for(size_t i=1; i<r.inputs.size(); ++i) EXPECT_LT(r.inputs[i-1]->id, r.inputs[i]->id);
}

TEST(TreeBuilder, StringQuotesAreStripped){
    auto r = build(make_rule("string", {make_terminal(0, "'it'")}), quiet);
    EXPECT_EQ(r.root->as<string_literal>()->value, "it");
    ASSERT_EQ(r.tokens.size(), 1u);
    EXPECT_EQ(r.tokens[0].text, "'it'");
}

TEST(TreeBuilder, EmptyArgumentRule){
    auto slot = make_rule("empty-argument", {make_terminal(2, ",")});
    auto r = build(slot, quiet);
    ASSERT_TRUE(r.root->is<empty_argument>());
    EXPECT_EQ(r.root->span->start, 2u);
    EXPECT_EQ(r.root->span->end, 3u);
}
