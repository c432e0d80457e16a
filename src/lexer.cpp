// ============================================================================
// lexer.cpp — propositional tokeniser implementation
// ============================================================================

#include "normform/lexer.hpp"

#include <cctype>

namespace normform {

// ── format_error ────────────────────────────────────────────────────────────

std::string format_error(const SourcePos& pos, const std::string& msg) {
    return std::to_string(pos.line) + ": ERROR: " + msg +
           " at column " + std::to_string(pos.column);
}

// ── LexError ────────────────────────────────────────────────────────────────

LexError::LexError(SourcePos pos, const std::string& reason)
    : std::runtime_error(format_error(pos, reason)), pos_(pos), reason_(reason) {}

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Term:     return "term";
        case TokenKind::KwTrue:   return "true";
        case TokenKind::KwFalse:  return "false";
        case TokenKind::Tilde:    return "~";
        case TokenKind::AndAnd:   return "&&";
        case TokenKind::OrOr:     return "||";
        case TokenKind::FatArrow: return "=>";
        case TokenKind::LParen:   return "(";
        case TokenKind::RParen:   return ")";
        case TokenKind::Eof:      return "end of input";
    }
    return "?";
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source, std::uint32_t line)
    : src_(source), pos_{line, 1} {}

// ── skip_whitespace ─────────────────────────────────────────────────────────

void Lexer::skip_whitespace() {
    while (idx_ < src_.size()) {
        char c = src_[idx_];
        if (c == '\n') {
            ++idx_;
            pos_.line++;
            pos_.column = 1;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            ++idx_;
            ++pos_.column;
        } else {
            break;
        }
    }
}

// ── at_symbol ───────────────────────────────────────────────────────────────
// True when one of the six symbols starts at idx_.  Two-character symbols
// need both characters: a lone '&', '|' or '=' belongs to a term.

bool Lexer::at_symbol() const noexcept {
    char c = src_[idx_];
    if (c == '~' || c == '(' || c == ')') return true;
    if (idx_ + 1 >= src_.size()) return false;
    char d = src_[idx_ + 1];
    return (c == '&' && d == '&') ||
           (c == '|' && d == '|') ||
           (c == '=' && d == '>');
}

Token Lexer::make_symbol(TokenKind kind, std::size_t length) {
    Token t{kind, std::string(src_.substr(idx_, length)), pos_};
    idx_ += length;
    pos_.column += static_cast<std::uint32_t>(length);
    return t;
}

// ── read_term_or_keyword ────────────────────────────────────────────────────
// Accumulate characters until whitespace or the start of a symbol.

Token Lexer::read_term_or_keyword() {
    SourcePos start = pos_;
    std::size_t begin = idx_;

    while (idx_ < src_.size() &&
           !std::isspace(static_cast<unsigned char>(src_[idx_])) &&
           !at_symbol()) {
        ++idx_;
        ++pos_.column;
    }

    std::string text(src_.substr(begin, idx_ - begin));

    TokenKind kind = TokenKind::Term;
    if (text == "true")       kind = TokenKind::KwTrue;
    else if (text == "false") kind = TokenKind::KwFalse;

    return Token{kind, std::move(text), start};
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    skip_whitespace();

    if (idx_ >= src_.size()) {
        return Token{TokenKind::Eof, "", pos_};
    }

    char c = src_[idx_];

    // ── single-character symbols ────────────────────────────────────────
    if (c == '~') return make_symbol(TokenKind::Tilde,  1);
    if (c == '(') return make_symbol(TokenKind::LParen, 1);
    if (c == ')') return make_symbol(TokenKind::RParen, 1);

    // ── two-character symbols ───────────────────────────────────────────
    if (idx_ + 1 < src_.size()) {
        char d = src_[idx_ + 1];
        if (c == '&' && d == '&') return make_symbol(TokenKind::AndAnd,   2);
        if (c == '|' && d == '|') return make_symbol(TokenKind::OrOr,     2);
        if (c == '=' && d == '>') return make_symbol(TokenKind::FatArrow, 2);
    }

    return read_term_or_keyword();
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, std::uint32_t line) {
    Lexer lex(source, line);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    if (toks.size() == 1) {
        throw LexError(SourcePos{line, 1}, "empty input");
    }
    return toks;
}

}  // namespace normform
