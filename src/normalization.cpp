// ============================================================================
// normalization.cpp — Implication elimination and NNF
// ============================================================================
//
// Each phase is a recursive transformation over the interned formula DAG.
//
// IMPORTANT: When recursively calling these functions, we must copy child IDs
// *before* the recursive call, because the call may grow the factory and
// invalidate any references to FormulaNode (e.g., `const FormulaNode& n`).
//
// ============================================================================

#include "normform/normalization.hpp"

namespace normform {

// ============================================================================
// Phase 1: Implication Elimination
// ============================================================================

FormulaId eliminate_implications(FormulaId id, FormulaFactory& f) {
    NodeKind kind = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    switch (kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Term:
            return id;

        case NodeKind::Not:
            return f.make_not(eliminate_implications(child0, f));

        case NodeKind::And: {
            auto c0 = eliminate_implications(child0, f);
            auto c1 = eliminate_implications(child1, f);
            return f.make_and(c0, c1);
        }

        case NodeKind::Or: {
            auto c0 = eliminate_implications(child0, f);
            auto c1 = eliminate_implications(child1, f);
            return f.make_or(c0, c1);
        }

        // φ => ψ  becomes  ~φ || ψ
        case NodeKind::Implies: {
            auto c0 = eliminate_implications(child0, f);
            auto c1 = eliminate_implications(child1, f);
            return f.make_or(f.make_not(c0), c1);
        }
    }

    return id;  // unreachable, but silences warnings
}

// ============================================================================
// Phase 2: NNF
// ============================================================================
//
// Two mutually recursive helpers: nnf_pos(φ) yields NNF of φ, nnf_neg(φ)
// yields NNF of ~φ.  This avoids building intermediate ~ nodes that would
// only be pushed down again.

namespace {

FormulaId nnf_neg(FormulaId id, FormulaFactory& f);

FormulaId nnf_pos(FormulaId id, FormulaFactory& f) {
    NodeKind kind = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    switch (kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Term:
            return id;

        case NodeKind::Not:
            return nnf_neg(child0, f);

        case NodeKind::And: {
            auto c0 = nnf_pos(child0, f);
            auto c1 = nnf_pos(child1, f);
            return f.make_and(c0, c1);
        }

        case NodeKind::Or: {
            auto c0 = nnf_pos(child0, f);
            auto c1 = nnf_pos(child1, f);
            return f.make_or(c0, c1);
        }

        case NodeKind::Implies: {
            auto c0 = nnf_neg(child0, f);
            auto c1 = nnf_pos(child1, f);
            return f.make_or(c0, c1);
        }
    }

    return id;
}

FormulaId nnf_neg(FormulaId id, FormulaFactory& f) {
    NodeKind kind = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    switch (kind) {
        case NodeKind::True:
            return f.make_false();

        case NodeKind::False:
            return f.make_true();

        // Already a literal.
        case NodeKind::Term:
            return f.make_not(id);

        // ~~φ  ≡  φ
        case NodeKind::Not:
            return nnf_pos(child0, f);

        // ~(φ && ψ)  ≡  ~φ || ~ψ
        case NodeKind::And: {
            auto c0 = nnf_neg(child0, f);
            auto c1 = nnf_neg(child1, f);
            return f.make_or(c0, c1);
        }

        // ~(φ || ψ)  ≡  ~φ && ~ψ
        case NodeKind::Or: {
            auto c0 = nnf_neg(child0, f);
            auto c1 = nnf_neg(child1, f);
            return f.make_and(c0, c1);
        }

        // ~(φ => ψ)  ≡  φ && ~ψ
        case NodeKind::Implies: {
            auto c0 = nnf_pos(child0, f);
            auto c1 = nnf_neg(child1, f);
            return f.make_and(c0, c1);
        }
    }

    return id;
}

}  // namespace

FormulaId to_nnf(FormulaId id, FormulaFactory& f) {
    return nnf_pos(id, f);
}

bool is_nnf(FormulaId id, const FormulaFactory& f) {
    const FormulaNode& n = f.node(id);
    switch (n.kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Term:
            return true;
        case NodeKind::Not:
            return f.node(n.children[0]).kind == NodeKind::Term;
        case NodeKind::And:
        case NodeKind::Or:
            return is_nnf(n.children[0], f) && is_nnf(n.children[1], f);
        case NodeKind::Implies:
            return false;
    }
    return false;
}

// ============================================================================
// Full pipeline
// ============================================================================

FormulaId normalize(FormulaId id, FormulaFactory& f) {
    id = eliminate_implications(id, f);
    id = to_nnf(id, f);
    return id;
}

}  // namespace normform
