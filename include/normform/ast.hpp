// ============================================================================
// normform/ast.hpp — Abstract Syntax Tree for propositional formulas
// ============================================================================
//
// Design notes:
//
//   Every formula is represented as a node in an interned DAG.  Two
//   formulas that are structurally identical share the same FormulaId.
//   This gives O(1) equality checks, which the simplifier relies on to
//   deduplicate literals and clauses.
//
//   Node types:
//     - Term      : atomic proposition (verbatim text)
//     - True/False: boolean constants
//     - Not       : negation, child[0]
//     - And       : conjunction, child[0] && child[1]
//     - Or        : disjunction, child[0] || child[1]
//     - Implies   : implication child[0] => child[1]   (pre-NNF only)
//
//   FormulaFactory owns all nodes and provides the interning mechanism
//   via structural hashing.  Clients receive FormulaId handles.  Nodes are
//   never mutated; every pass builds new ids.
//
// ============================================================================

#ifndef NORMFORM_AST_HPP
#define NORMFORM_AST_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace normform {

// ── FormulaId ───────────────────────────────────────────────────────────────
// A lightweight handle into the formula interning table.  The id is an index
// into the FormulaFactory's internal node vector.  The special value
// kInvalidId signals "no formula".
// ─────────────────────────────────────────────────────────────────────────────

using FormulaId = std::uint32_t;
inline constexpr FormulaId kInvalidId = static_cast<FormulaId>(-1);

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    // Constants
    True,
    False,

    // Atomic proposition
    Term,

    // Boolean connectives
    Not,
    And,
    Or,
    Implies    // only before implication elimination
};

/// Human-readable string for a NodeKind.
const char* node_kind_name(NodeKind k) noexcept;

// ── FormulaNode ─────────────────────────────────────────────────────────────
// Immutable stored node.  All data is value-semantics; the FormulaFactory is
// the sole owner.

struct FormulaNode {
    NodeKind    kind{};
    std::string term_name;       // non-empty for Term nodes
    FormulaId   children[2]{kInvalidId, kInvalidId};

    // Structural-equality (used by the interning table).
    bool operator==(const FormulaNode& o) const noexcept;
};

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Hash functor for FormulaNode, combining kind + term_name + children.

struct FormulaNodeHash {
    std::size_t operator()(const FormulaNode& n) const noexcept;
};

// ── FormulaFactory ──────────────────────────────────────────────────────────
// Thread-unsafe (single-threaded design).  Owns the node storage and the
// interning map.  Every make_*() method returns the canonical FormulaId for
// that structure.

class FormulaFactory {
public:
    FormulaFactory();

    // ── Constructors ────────────────────────────────────────────────────
    FormulaId make_true();
    FormulaId make_false();
    FormulaId make_term(const std::string& name);
    FormulaId make_not(FormulaId child);
    FormulaId make_and(FormulaId lhs, FormulaId rhs);
    FormulaId make_or(FormulaId lhs, FormulaId rhs);
    FormulaId make_implies(FormulaId lhs, FormulaId rhs);

    // ── Accessors ───────────────────────────────────────────────────────
    const FormulaNode& node(FormulaId id) const;
    NodeKind           kind(FormulaId id) const { return node(id).kind; }
    std::size_t        size() const noexcept;

    // ── Literal helpers ─────────────────────────────────────────────────
    // A literal is a Term or Not(Term).

    bool is_literal(FormulaId id) const;

    /// Name of the term underneath a literal.  Throws std::invalid_argument
    /// when `id` is not a literal.
    const std::string& literal_name(FormulaId id) const;

    /// True for Term, false for Not(Term).
    bool literal_positive(FormulaId id) const;

    /// The literal of opposite polarity on the same term.
    FormulaId complement(FormulaId literal);

    // ── Pretty-print ────────────────────────────────────────────────────
    // Returns a fully parenthesised string representation of a formula.
    // For minimal-parenthesis output see printer.hpp.
    std::string to_string(FormulaId id) const;

private:
    // Intern a node: return existing id when structurally equal, otherwise
    // allocate a new slot.
    FormulaId intern(FormulaNode node);

    std::vector<FormulaNode>                                    nodes_;
    std::unordered_map<FormulaNode, FormulaId, FormulaNodeHash> intern_;
};

// ── FormulaSet ──────────────────────────────────────────────────────────────
// Canonical sorted vector of FormulaIds.  Provides deterministic iteration
// and O(log n) membership.  Used to hold the literals of one clause.

class FormulaSet {
public:
    FormulaSet() = default;

    void insert(FormulaId id);
    bool contains(FormulaId id) const noexcept;
    bool empty() const noexcept;
    std::size_t size() const noexcept;

    /// True when every element of this set is also in `o`.
    bool is_subset_of(const FormulaSet& o) const noexcept;

    const std::vector<FormulaId>& elements() const noexcept;

    bool operator==(const FormulaSet& o) const noexcept;
    bool operator<(const FormulaSet& o) const noexcept;

private:
    std::vector<FormulaId> data_;  // sorted, unique
};

}  // namespace normform

#endif  // NORMFORM_AST_HPP
