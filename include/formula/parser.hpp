#pragma once
#include "formula/ast.hpp"
#include "formula/cst.hpp"
#include "formula/env.hpp"
#include <string_view>

namespace formula {

// Parse formula text into a CST. Never throws on bad input: a grammar failure
// yields an "evaluation" root holding one "error" node with the parser message.
cst::node_ptr parse(std::string_view src);
cst::node_ptr parse(std::string_view src, const build_env& env);

// parse() followed by build().
build_result parse_formula(std::string_view src);
build_result parse_formula(std::string_view src, const build_env& env);

} // namespace formula
