// ============================================================================
// normform/converter.hpp — The end-to-end conversion pipeline
// ============================================================================
//
//   text ──tokenise/parse──▶ parsed ──normalize──▶ nnf
//        ──distribute──▶ distributed ──simplify──▶ simplified ──render──▶ text
//
// Every intermediate handle is kept so the CLI can trace the stages and the
// self-tests can check each invariant separately.
//
// ============================================================================

#ifndef NORMFORM_CONVERTER_HPP
#define NORMFORM_CONVERTER_HPP

#include "normform/ast.hpp"
#include "normform/normal_form.hpp"

#include <cstdint>
#include <string>

namespace normform {

struct Conversion {
    NormalForm  form = NormalForm::Cnf;
    FormulaId   parsed = kInvalidId;
    FormulaId   nnf = kInvalidId;
    FormulaId   distributed = kInvalidId;
    FormulaId   simplified = kInvalidId;
    std::string text;              // render(simplified)
};

/// Run the whole pipeline on one sentence.  Throws LexError / ParseError.
Conversion convert(const std::string& input, NormalForm form,
                   FormulaFactory& factory, std::uint32_t line = 1);

/// Convenience: convert with a private factory and return only the text.
std::string convert_to_string(const std::string& input, NormalForm form);

}  // namespace normform

#endif  // NORMFORM_CONVERTER_HPP
