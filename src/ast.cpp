// ============================================================================
// ast.cpp — Implementation of the formula AST, interning, and debug printing
// ============================================================================

#include "normform/ast.hpp"

#include <algorithm>
#include <stdexcept>

namespace normform {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::True:    return "true";
        case NodeKind::False:   return "false";
        case NodeKind::Term:    return "Term";
        case NodeKind::Not:     return "~";
        case NodeKind::And:     return "&&";
        case NodeKind::Or:      return "||";
        case NodeKind::Implies: return "=>";
    }
    return "?";
}

// ── FormulaNode ─────────────────────────────────────────────────────────────

bool FormulaNode::operator==(const FormulaNode& o) const noexcept {
    return kind == o.kind &&
           term_name == o.term_name &&
           children[0] == o.children[0] &&
           children[1] == o.children[1];
}

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Combine kind, term_name and children via FNV-like mixing.

std::size_t FormulaNodeHash::operator()(const FormulaNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<std::string>{}(n.term_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[0]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[1]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ── FormulaFactory ──────────────────────────────────────────────────────────

FormulaFactory::FormulaFactory() {
    // Slots 0 and 1 always hold the canonical true/false.
    make_true();
    make_false();
}

FormulaId FormulaFactory::intern(FormulaNode node) {
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    FormulaId id = static_cast<FormulaId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

// ── make_* helpers ──────────────────────────────────────────────────────────

FormulaId FormulaFactory::make_true() {
    FormulaNode n;
    n.kind = NodeKind::True;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_false() {
    FormulaNode n;
    n.kind = NodeKind::False;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_term(const std::string& name) {
    FormulaNode n;
    n.kind = NodeKind::Term;
    n.term_name = name;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_not(FormulaId child) {
    FormulaNode n;
    n.kind = NodeKind::Not;
    n.children[0] = child;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_and(FormulaId lhs, FormulaId rhs) {
    FormulaNode n;
    n.kind = NodeKind::And;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_or(FormulaId lhs, FormulaId rhs) {
    FormulaNode n;
    n.kind = NodeKind::Or;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_implies(FormulaId lhs, FormulaId rhs) {
    FormulaNode n;
    n.kind = NodeKind::Implies;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

// ── Accessors ───────────────────────────────────────────────────────────────

const FormulaNode& FormulaFactory::node(FormulaId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("FormulaFactory::node: invalid FormulaId");
    }
    return nodes_[id];
}

std::size_t FormulaFactory::size() const noexcept {
    return nodes_.size();
}

// ── Literal helpers ─────────────────────────────────────────────────────────

bool FormulaFactory::is_literal(FormulaId id) const {
    const FormulaNode& n = node(id);
    if (n.kind == NodeKind::Term) return true;
    return n.kind == NodeKind::Not && node(n.children[0]).kind == NodeKind::Term;
}

const std::string& FormulaFactory::literal_name(FormulaId id) const {
    const FormulaNode& n = node(id);
    if (n.kind == NodeKind::Term) return n.term_name;
    if (n.kind == NodeKind::Not) {
        const FormulaNode& c = node(n.children[0]);
        if (c.kind == NodeKind::Term) return c.term_name;
    }
    throw std::invalid_argument("literal_name: not a literal: " + to_string(id));
}

bool FormulaFactory::literal_positive(FormulaId id) const {
    return node(id).kind == NodeKind::Term;
}

FormulaId FormulaFactory::complement(FormulaId literal) {
    // Copy the child before interning: make_not may grow nodes_.
    const NodeKind  k     = node(literal).kind;
    const FormulaId child = node(literal).children[0];
    if (k == NodeKind::Term) return make_not(literal);
    if (k == NodeKind::Not && node(child).kind == NodeKind::Term) return child;
    throw std::invalid_argument("complement: not a literal: " + to_string(literal));
}

// ── Pretty-printing ─────────────────────────────────────────────────────────
// Produces a fully parenthesised string for unambiguity.

std::string FormulaFactory::to_string(FormulaId id) const {
    const FormulaNode& n = node(id);

    switch (n.kind) {
        case NodeKind::True:
            return "true";
        case NodeKind::False:
            return "false";
        case NodeKind::Term:
            return n.term_name;
        case NodeKind::Not:
            return "(~" + to_string(n.children[0]) + ")";
        case NodeKind::And:
            return "(" + to_string(n.children[0]) + " && " + to_string(n.children[1]) + ")";
        case NodeKind::Or:
            return "(" + to_string(n.children[0]) + " || " + to_string(n.children[1]) + ")";
        case NodeKind::Implies:
            return "(" + to_string(n.children[0]) + " => " + to_string(n.children[1]) + ")";
    }
    return "<?>";
}

// ── FormulaSet ──────────────────────────────────────────────────────────────
// Maintains a sorted, unique vector of FormulaIds.

void FormulaSet::insert(FormulaId id) {
    auto pos = std::lower_bound(data_.begin(), data_.end(), id);
    if (pos == data_.end() || *pos != id) {
        data_.insert(pos, id);
    }
}

bool FormulaSet::contains(FormulaId id) const noexcept {
    return std::binary_search(data_.begin(), data_.end(), id);
}

bool FormulaSet::empty() const noexcept {
    return data_.empty();
}

std::size_t FormulaSet::size() const noexcept {
    return data_.size();
}

bool FormulaSet::is_subset_of(const FormulaSet& o) const noexcept {
    return std::includes(o.data_.begin(), o.data_.end(),
                         data_.begin(), data_.end());
}

const std::vector<FormulaId>& FormulaSet::elements() const noexcept {
    return data_;
}

bool FormulaSet::operator==(const FormulaSet& o) const noexcept {
    return data_ == o.data_;
}

bool FormulaSet::operator<(const FormulaSet& o) const noexcept {
    return data_ < o.data_;
}

}  // namespace normform
