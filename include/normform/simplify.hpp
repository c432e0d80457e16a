// ============================================================================
// normform/simplify.hpp — Clause-level simplification of CNF / DNF
// ============================================================================
//
// Works on the two-level structure produced by distribute():
//
//   1. literals inside a clause are deduplicated (interning makes this an
//      id comparison);
//   2. a clause holding a literal and its complement is dropped: it is
//      always true in CNF and always false in DNF, i.e. the neutral
//      element of the outer connective;
//   3. constants are folded: the clause-absorbing constant (true in CNF,
//      false in DNF) drops the clause, the other one is removed from it;
//      an emptied clause collapses the whole formula;
//   4. identical clauses are merged; two complementary unit clauses
//      collapse the formula (a && ~a in CNF, a || ~a in DNF);
//   5. clauses subsumed by a smaller one are dropped (absorption:
//      a && (a || b) = a);
//   6. with no clause left the formula is the outer neutral element;
//   7. literals and clauses are sorted by term name so output does not
//      depend on interning order;
//   8. single-clause and single-literal wrappers disappear naturally when
//      the result is rebuilt.
//
// simplify() is idempotent.
//
// ============================================================================

#ifndef NORMFORM_SIMPLIFY_HPP
#define NORMFORM_SIMPLIFY_HPP

#include "normform/ast.hpp"
#include "normform/normal_form.hpp"

#include <vector>

namespace normform {

/// Split a normal-form formula into its clauses, each a set of literal (or
/// constant) ids.  Throws std::invalid_argument if `id` is not in `form`.
std::vector<FormulaSet> collect_clauses(FormulaId id, NormalForm form,
                                        const FormulaFactory& f);

/// Simplify a formula already in `form` (see is_normal_form()).
FormulaId simplify(FormulaId id, NormalForm form, FormulaFactory& f);

}  // namespace normform

#endif  // NORMFORM_SIMPLIFY_HPP
