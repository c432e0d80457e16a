// ============================================================================
// normform/normal_form.hpp — Distribution into CNF / DNF
// ============================================================================
//
// Converts an NNF formula into a two-level structure:
//
//   CNF :  (l || l || ...) && (l || ...) && ...     outer &&, inner ||
//   DNF :  (l && l && ...) || (l && ...) || ...     outer ||, inner &&
//
// by repeatedly applying the distributive law of the inner connective over
// the outer one:
//
//   CNF:  (a && b) || c   ≡   (a || c) && (b || c)
//   DNF:  (a || b) && c   ≡   (a && c) || (b && c)
//
// Each step moves an outer connective above an inner one, so the nesting
// depth of outer-inside-inner strictly decreases and the rewrite terminates.
// The clause count can grow exponentially on adversarial input; that is
// inherent to the transformation.
//
// ============================================================================

#ifndef NORMFORM_NORMAL_FORM_HPP
#define NORMFORM_NORMAL_FORM_HPP

#include "normform/ast.hpp"

namespace normform {

// ── NormalForm ──────────────────────────────────────────────────────────────

enum class NormalForm {
    Cnf,
    Dnf
};

const char* normal_form_name(NormalForm form) noexcept;

/// The connective joining clauses (&& for CNF, || for DNF).
NodeKind outer_kind(NormalForm form) noexcept;

/// The connective joining literals inside a clause (|| for CNF, && for DNF).
NodeKind inner_kind(NormalForm form) noexcept;

// ── Distribution ────────────────────────────────────────────────────────────
// Input must be in NNF (see normalization.hpp).  Constants are treated as
// literals here; the simplifier folds them away.

FormulaId distribute(FormulaId nnf, NormalForm form, FormulaFactory& f);

FormulaId to_cnf(FormulaId nnf, FormulaFactory& f);
FormulaId to_dnf(FormulaId nnf, FormulaFactory& f);

/// True when `id` has the two-level shape of `form`: no outer connective
/// below an inner one, and Not only on terms.
bool is_normal_form(FormulaId id, NormalForm form, const FormulaFactory& f);

}  // namespace normform

#endif  // NORMFORM_NORMAL_FORM_HPP
