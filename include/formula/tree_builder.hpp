// CST -> AST transform.
#pragma once
#include "formula/ast.hpp"
#include "formula/cst.hpp"
#include "formula/env.hpp"

namespace formula {

// Build the AST and its side tables from a CST root.
// Malformed input never throws: it surfaces as error_node / empty_argument values.
// Throws std::invalid_argument only when a token is built from a missing or inconsistent symbol.
build_result build(const cst::node_ptr& root);
build_result build(const cst::node_ptr& root, const build_env& env);

// Span of a CST node: [start.start, stop.stop + 1], [start.start, start.stop + 1],
// [sym.start, sym.stop + 1], or nothing.
std::optional<source_span> span_of(const cst::node& n);

// Token over a source symbol. Throws std::invalid_argument if the symbol is missing.
token make_token(token_kind kind, const std::optional<cst::symbol>& sym);

} // namespace formula
