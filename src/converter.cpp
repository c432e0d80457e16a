// ============================================================================
// converter.cpp — End-to-end conversion pipeline
// ============================================================================

#include "normform/converter.hpp"
#include "normform/normalization.hpp"
#include "normform/parser.hpp"
#include "normform/printer.hpp"
#include "normform/simplify.hpp"

namespace normform {

Conversion convert(const std::string& input, NormalForm form,
                   FormulaFactory& factory, std::uint32_t line) {
    Conversion c;
    c.form        = form;
    c.parsed      = parse_formula(input, factory, line);
    c.nnf         = normalize(c.parsed, factory);
    c.distributed = distribute(c.nnf, form, factory);
    c.simplified  = simplify(c.distributed, form, factory);
    c.text        = render(c.simplified, factory);
    return c;
}

std::string convert_to_string(const std::string& input, NormalForm form) {
    FormulaFactory factory;
    return convert(input, form, factory).text;
}

}  // namespace normform
