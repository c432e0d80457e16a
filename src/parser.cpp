// ============================================================================
// parser.cpp — Recursive-descent propositional parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// The recursive-descent structure mirrors the grammar directly:
//
//   parse()              calls parse_implication() and then expects Eof.
//   parse_implication()  handles  =>  (right-associative via recursion).
//   parse_disjunction()  handles  ||  (left-associative).
//   parse_conjunction()  handles  &&  (left-associative).
//   parse_negation()     handles  ~   (prefix).
//   parse_primary()      handles  terms, true, false, parentheses.
//
// The token vector always ends with Eof, so peek() never runs off the end.
//
// All error messages follow the format:
//   <line>: ERROR: <message> at column <n>
//
// ============================================================================

#include "normform/parser.hpp"

namespace normform {

// ── ParseError ──────────────────────────────────────────────────────────────

ParseError::ParseError(SourcePos pos, const std::string& reason)
    : std::runtime_error(format_error(pos, reason)), pos_(pos), reason_(reason) {}

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(const std::vector<Token>& tokens, FormulaFactory& factory)
    : toks_(tokens), fac_(factory) {}

// ── Helpers ─────────────────────────────────────────────────────────────────

const Token& Parser::peek() const {
    if (idx_ >= toks_.size()) {
        // A vector not built by tokenise(); treat as end of input.
        static const Token eof{};
        return toks_.empty() ? eof : toks_.back();
    }
    return toks_[idx_];
}

const Token& Parser::advance() {
    const Token& t = peek();
    if (idx_ < toks_.size()) ++idx_;
    return t;
}

bool Parser::starts_operand(TokenKind kind) const noexcept {
    return kind == TokenKind::Term ||
           kind == TokenKind::KwTrue ||
           kind == TokenKind::KwFalse ||
           kind == TokenKind::Tilde ||
           kind == TokenKind::LParen;
}

void Parser::error(const Token& tok, const std::string& msg) const {
    throw ParseError(tok.pos, msg);
}

// Called when a complete operand is followed by something that is neither a
// binary operator nor the expected terminator.
void Parser::error_after_operand(const Token& tok) const {
    if (starts_operand(tok.kind)) {
        error(tok, "missing operator before '" + tok.text + "'");
    }
    if (tok.kind == TokenKind::RParen) {
        error(tok, "unbalanced parentheses: unmatched ')'");
    }
    error(tok, "unexpected token '" + tok.text + "'");
}

// ── parse ───────────────────────────────────────────────────────────────────
// Entry point: parse one formula then require end-of-input.

FormulaId Parser::parse() {
    if (peek().kind == TokenKind::Eof) {
        error(peek(), "empty expression");
    }
    FormulaId f = parse_implication();
    const Token& t = peek();
    if (t.kind != TokenKind::Eof) {
        error_after_operand(t);
    }
    return f;
}

// ── parse_implication ───────────────────────────────────────────────────────
// implication ::= disjunction ( '=>' implication )?
// Right-associative: a => b => c  =  a => (b => c)

FormulaId Parser::parse_implication() {
    FormulaId lhs = parse_disjunction();
    if (peek().kind == TokenKind::FatArrow) {
        advance();  // consume '=>'
        FormulaId rhs = parse_implication();
        return fac_.make_implies(lhs, rhs);
    }
    return lhs;
}

// ── parse_disjunction ───────────────────────────────────────────────────────
// disjunction ::= conjunction ( '||' conjunction )*

FormulaId Parser::parse_disjunction() {
    FormulaId lhs = parse_conjunction();
    while (peek().kind == TokenKind::OrOr) {
        advance();  // consume '||'
        FormulaId rhs = parse_conjunction();
        lhs = fac_.make_or(lhs, rhs);
    }
    return lhs;
}

// ── parse_conjunction ───────────────────────────────────────────────────────
// conjunction ::= negation ( '&&' negation )*

FormulaId Parser::parse_conjunction() {
    FormulaId lhs = parse_negation();
    while (peek().kind == TokenKind::AndAnd) {
        advance();  // consume '&&'
        FormulaId rhs = parse_negation();
        lhs = fac_.make_and(lhs, rhs);
    }
    return lhs;
}

// ── parse_negation ──────────────────────────────────────────────────────────
// negation ::= '~' negation | primary

FormulaId Parser::parse_negation() {
    if (peek().kind == TokenKind::Tilde) {
        advance();
        return fac_.make_not(parse_negation());
    }
    return parse_primary();
}

// ── parse_primary ───────────────────────────────────────────────────────────
// primary ::= TERM | 'true' | 'false' | '(' implication ')'

FormulaId Parser::parse_primary() {
    const Token& t = peek();

    switch (t.kind) {
        case TokenKind::Term:
            advance();
            return fac_.make_term(t.text);

        case TokenKind::KwTrue:
            advance();
            return fac_.make_true();

        case TokenKind::KwFalse:
            advance();
            return fac_.make_false();

        case TokenKind::LParen: {
            Token open = advance();
            FormulaId inner = parse_implication();
            const Token& close = peek();
            if (close.kind == TokenKind::RParen) {
                advance();
                return inner;
            }
            if (close.kind == TokenKind::Eof) {
                error(close, "unbalanced parentheses: '(' at column " +
                             std::to_string(open.pos.column) + " is never closed");
            }
            error_after_operand(close);
        }

        default:
            break;
    }

    // No operand here.  Describe the problem relative to the previous token.
    const Token* prev = idx_ > 0 ? &toks_[idx_ - 1] : nullptr;
    const bool prev_is_binary = prev &&
        (prev->kind == TokenKind::AndAnd || prev->kind == TokenKind::OrOr ||
         prev->kind == TokenKind::FatArrow);

    if (prev_is_binary) {
        error(t, "missing right operand for '" + prev->text + "'");
    }
    if (prev && prev->kind == TokenKind::Tilde) {
        error(t, "missing operand for '~'");
    }
    if (t.kind == TokenKind::AndAnd || t.kind == TokenKind::OrOr ||
        t.kind == TokenKind::FatArrow) {
        error(t, "missing left operand for '" + t.text + "'");
    }
    if (t.kind == TokenKind::RParen) {
        if (prev && prev->kind == TokenKind::LParen) {
            error(t, "empty parentheses");
        }
        error(t, "unbalanced parentheses: unmatched ')'");
    }
    if (t.kind == TokenKind::Eof && prev && prev->kind == TokenKind::LParen) {
        error(t, "unbalanced parentheses: '(' is never closed");
    }
    error(t, "expected term, 'true', 'false', '~' or '(', got '" +
             std::string(token_kind_name(t.kind)) + "'");
}

// ── Free function convenience ───────────────────────────────────────────────

FormulaId parse_formula(const std::string& input, FormulaFactory& factory,
                        std::uint32_t line) {
    std::vector<Token> tokens = tokenise(input, line);
    Parser parser(tokens, factory);
    return parser.parse();
}

}  // namespace normform
