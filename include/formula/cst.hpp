// Concrete syntax tree consumed by the tree builder.
// Any grammar front end can feed the builder as long as it produces this shape.
#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace formula::cst {

// A lexical token. `stop` is the offset of the last character (inclusive).
struct symbol {
    std::size_t start = 0;
    std::size_t stop = 0;
    std::string text;
};

struct node;
using node_ptr = std::shared_ptr<node>;

struct node {
    std::string type;                        // rule kind, empty for terminals
    std::vector<node_ptr> children;
    std::optional<symbol> start;             // first token of a rule node
    std::optional<symbol> stop;              // last token of a rule node
    std::optional<symbol> sym;               // set on terminals only
    std::optional<std::string> exception;    // grammar-level failure payload
    // Labelled sub-parts (items, keys, vals, name, args, namedArgs). Entries may be null.
    std::unordered_map<std::string, std::vector<node_ptr>> fields;

    bool is_terminal() const { return sym.has_value(); }

    // Source text of all terminals below this node, concatenated without separators.
    std::string text() const {
        if (sym)
            return sym->text;
        std::string out;
        for (auto& c : children)
            if (c)
                out += c->text();
        return out;
    }

    const std::vector<node_ptr>* field(std::string_view label) const {
        auto it = fields.find(std::string(label));
        return it == fields.end() ? nullptr : &it->second;
    }

    // First entry of a label, or null.
    node_ptr field_one(std::string_view label) const {
        auto* f = field(label);
        return (f && !f->empty()) ? f->front() : nullptr;
    }
};

// ------ construction helpers (used by grammar adapters and tests) ------

inline node_ptr make_terminal(std::size_t start, std::string text) {
    auto n = std::make_shared<node>();
    std::size_t stop = text.empty() ? start : start + text.size() - 1;
    n->sym = symbol{start, stop, std::move(text)};
    return n;
}

// Rule node whose start/stop tokens are taken from its outermost children.
inline node_ptr make_rule(std::string type, std::vector<node_ptr> children) {
    auto n = std::make_shared<node>();
    n->type = std::move(type);
    n->children = std::move(children);
    for (auto& c : n->children) {
        if (!c)
            continue;
        n->start = c->sym ? c->sym : c->start;
        break;
    }
    for (auto it = n->children.rbegin(); it != n->children.rend(); ++it) {
        if (!*it)
            continue;
        auto& c = *it;
        n->stop = c->sym ? c->sym : (c->stop ? c->stop : c->start);
        break;
    }
    return n;
}

} // namespace formula::cst
