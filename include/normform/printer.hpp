// ============================================================================
// normform/printer.hpp — Rendering formulas back to the input syntax
// ============================================================================
//
// render() produces text that parse_formula() reads back to the same
// FormulaId.  Parentheses are inserted only where the parser's precedence
// requires them:
//
//   level  operator  associativity
//     1      =>        right
//     2      ||        left
//     3      &&        left
//     4      ~         prefix
//     5      term, true, false
//
// A sub-formula is parenthesised iff its level is lower than the level of
// the context it is printed in.  The operand on the associative side
// inherits the operator's own level, the other operand needs one more.
//
// ============================================================================

#ifndef NORMFORM_PRINTER_HPP
#define NORMFORM_PRINTER_HPP

#include "normform/ast.hpp"

#include <string>

namespace normform {

/// Binding level of the top connective of a node (1 = loosest).
int precedence(NodeKind kind) noexcept;

/// Minimal-parenthesis rendering, e.g. "(~a || b) && (~a || ~c)".
std::string render(FormulaId id, const FormulaFactory& f);

}  // namespace normform

#endif  // NORMFORM_PRINTER_HPP
