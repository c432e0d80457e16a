// ============================================================================
// normform/parser.hpp — Recursive-descent parser for propositional formulas
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   formula      ::= implication
//   implication  ::= disjunction ( '=>' implication )?     (right-assoc)
//   disjunction  ::= conjunction ( '||' conjunction )*     (left-assoc)
//   conjunction  ::= negation    ( '&&' negation )*        (left-assoc)
//   negation     ::= '~' negation
//                  | primary
//   primary      ::= TERM | 'true' | 'false'
//                  | '(' implication ')'
//
// Precedence (highest → lowest):
//   1. ~    (unary prefix)
//   2. &&   (left-assoc)
//   3. ||   (left-assoc)
//   4. =>   (right-assoc: a => b => c  =  a => (b => c))
//
// ============================================================================

#ifndef NORMFORM_PARSER_HPP
#define NORMFORM_PARSER_HPP

#include "normform/ast.hpp"
#include "normform/lexer.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace normform {

// ── ParseError ──────────────────────────────────────────────────────────────
// what() is formatted as  <line>: ERROR: <reason> at column <n>

class ParseError : public std::runtime_error {
public:
    ParseError(SourcePos pos, const std::string& reason);

    const SourcePos&   position() const noexcept { return pos_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    SourcePos   pos_;
    std::string reason_;
};

// ── Parser ──────────────────────────────────────────────────────────────────
// Consumes a token sequence produced by tokenise() (Eof-terminated) and
// builds the formula in a FormulaFactory.  Parses exactly one formula and
// returns its FormulaId.  Throws ParseError on syntax errors.

class Parser {
public:
    Parser(const std::vector<Token>& tokens, FormulaFactory& factory);

    /// Parse a complete formula (expects Eof after).
    FormulaId parse();

private:
    // ── Recursive-descent methods, one per precedence level ─────────────
    FormulaId parse_implication();
    FormulaId parse_disjunction();
    FormulaId parse_conjunction();
    FormulaId parse_negation();
    FormulaId parse_primary();

    // ── Helpers ─────────────────────────────────────────────────────────
    const Token& peek() const;
    const Token& advance();
    bool starts_operand(TokenKind kind) const noexcept;
    [[noreturn]] void error(const Token& tok, const std::string& msg) const;
    [[noreturn]] void error_after_operand(const Token& tok) const;

    const std::vector<Token>& toks_;
    std::size_t               idx_ = 0;
    FormulaFactory&           fac_;
};

// ── Convenience free function ───────────────────────────────────────────────
// Tokenise and parse a single formula from a string.  Throws LexError or
// ParseError.

FormulaId parse_formula(const std::string& input, FormulaFactory& factory,
                        std::uint32_t line = 1);

}  // namespace normform

#endif  // NORMFORM_PARSER_HPP
