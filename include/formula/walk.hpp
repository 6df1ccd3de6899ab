// Pre-order depth-first traversal shared by every AST consumer.
#pragma once
#include "formula/ast.hpp"
#include "formula/env.hpp"
#include <functional>
#include <vector>

namespace formula {

struct walk_options {
    // Also descend into named arguments (after positional ones) and their values.
    bool named_arguments = false;
};

inline walk_options walk_options_from(const build_env& env) { return walk_options{env.walk_named_args}; }

using visit_fn = std::function<void(const node&)>;

// Visit each node once, parent before children, children in source order:
//   definition -> expr, call -> args, array -> values, object -> entry values, pipe -> left, right.
// Everything else is a leaf.
void walk(const node_ptr& root, const visit_fn& visit, const walk_options& opts = {});
inline void walk(const build_result& r, const visit_fn& visit, const walk_options& opts = {}) { walk(r.root, visit, opts); }

// Children of one node in the order walk() visits them.
std::vector<node_ptr> children_of(const node& n, const walk_options& opts = {});

} // namespace formula
