// ============================================================================
// normform/z3_checker.hpp — Z3 wrapper for equivalence checking
// ============================================================================
//
// Cross-checks a conversion: the input formula and its normal form must be
// logically equivalent.  Both are translated to Z3 boolean expressions and
// the solver is asked for an assignment on which they differ.
//
// Usage:
//   EquivalenceChecker checker(factory);
//   EquivalenceResult r = checker.check(conv.parsed, conv.simplified);
//   if (r.verdict != Equivalence::Equivalent) { ... r.counterexample ... }
//
// IMPORTANT: Z3 is ONLY used to verify a finished conversion (--verify and
// the self-tests).  The normal form itself is always computed by rewriting.
//
// ============================================================================

#ifndef NORMFORM_Z3_CHECKER_HPP
#define NORMFORM_Z3_CHECKER_HPP

#include "normform/ast.hpp"

#include <z3++.h>

#include <map>
#include <memory>
#include <string>

namespace normform {

// ── Equivalence ─────────────────────────────────────────────────────────────

enum class Equivalence {
    Equivalent,
    NotEquivalent,
    Unknown
};

const char* equivalence_name(Equivalence e) noexcept;

struct EquivalenceResult {
    Equivalence verdict = Equivalence::Unknown;
    std::string counterexample;   // "{a = true, b = false}" for NotEquivalent
};

// ── EquivalenceChecker ──────────────────────────────────────────────────────
// Owns a Z3 context.  Term names map to Z3 boolean constants; the same name
// always yields the same constant across calls.

class EquivalenceChecker {
public:
    explicit EquivalenceChecker(const FormulaFactory& factory);

    /// Decide whether `lhs` and `rhs` agree on every assignment.
    EquivalenceResult check(FormulaId lhs, FormulaId rhs);

    /// Decide whether `id` is true on every assignment.
    bool is_valid(FormulaId id);

private:
    // Convert a formula to a Z3 boolean expression.
    z3::expr to_z3_bool(FormulaId id);

    // Get or create a Z3 boolean variable for the given term name.
    z3::expr get_bool_var(const std::string& name);

    std::string model_to_string(const z3::model& model);

    const FormulaFactory& factory_;
    z3::context          ctx_;

    // Ordered so counter-examples list terms alphabetically.
    std::map<std::string, std::unique_ptr<z3::expr>> bool_vars_;
};

}  // namespace normform

#endif  // NORMFORM_Z3_CHECKER_HPP
