// ============================================================================
// normform/normalization.hpp — Implication elimination and NNF
// ============================================================================
//
// The normalization pipeline transforms an arbitrary parsed formula into
// negation normal form, the input expected by the distributor.
//
//   1. Eliminate =>  — rewrite implications to disjunctions.
//   2. NNF           — push negation inward until it rests only on terms.
//
// Both phases are pure functions: they take a FormulaId and a
// FormulaFactory and return a new (interned) FormulaId.
//
// The `normalize()` function chains both in order.
//
// ============================================================================

#ifndef NORMFORM_NORMALIZATION_HPP
#define NORMFORM_NORMALIZATION_HPP

#include "normform/ast.hpp"

namespace normform {

// ── Phase 1: Implication elimination ────────────────────────────────────────
//
//   φ => ψ   ≡   ~φ || ψ
//
// After this phase the formula contains no Implies nodes.

FormulaId eliminate_implications(FormulaId id, FormulaFactory& f);

// ── Phase 2: Negation Normal Form (NNF) ─────────────────────────────────────
//
// Rewrite rules for ~:
//
//   ~~φ          ≡   φ
//   ~(φ && ψ)    ≡   ~φ || ~ψ          (De Morgan)
//   ~(φ || ψ)    ≡   ~φ && ~ψ          (De Morgan)
//   ~(φ => ψ)    ≡   φ && ~ψ
//   ~true        ≡   false
//   ~false       ≡   true
//
// Implications met on the way are eliminated as well, so to_nnf() is total
// on any parsed formula.  After NNF, negation appears only on Term nodes.

FormulaId to_nnf(FormulaId id, FormulaFactory& f);

/// True when every Not node in `id` wraps a Term and no Implies remains.
bool is_nnf(FormulaId id, const FormulaFactory& f);

// ── Full pipeline ───────────────────────────────────────────────────────────
// Chains: eliminate_implications → to_nnf.

FormulaId normalize(FormulaId id, FormulaFactory& f);

}  // namespace normform

#endif  // NORMFORM_NORMALIZATION_HPP
