// ============================================================================
// normform/lexer.hpp — Tokeniser for the propositional input language
// ============================================================================
//
// The lexer converts a raw input string into a stream of tokens.  Every
// token carries its source position (line, column) so that error messages
// can point the user to the exact location of a problem.
//
// Recognised tokens:
//   Symbols   ~  &&  ||  =>  (  )      matched longest-first
//   Keywords  true  false
//   Terms     any maximal run of non-whitespace characters that does not
//             start a symbol, taken verbatim ("x1", "p.q", "a&b", "a=b")
//   EOF       end-of-input sentinel
//
// Whitespace separates tokens and is skipped.
//
// ============================================================================

#ifndef NORMFORM_LEXER_HPP
#define NORMFORM_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace normform {

// ── SourcePos ───────────────────────────────────────────────────────────────
// 1-based line and column, used for error reporting.

struct SourcePos {
    std::uint32_t line   = 1;
    std::uint32_t column = 1;
};

/// Format: <line>: ERROR: <msg> at column <n>
std::string format_error(const SourcePos& pos, const std::string& msg);

// ── LexError ────────────────────────────────────────────────────────────────
// Raised when the input cannot be tokenised.  With the permissive term rule
// this only happens for empty or whitespace-only input.

class LexError : public std::runtime_error {
public:
    LexError(SourcePos pos, const std::string& reason);

    const SourcePos&   position() const noexcept { return pos_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    SourcePos   pos_;
    std::string reason_;
};

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    Term,           // atomic proposition
    KwTrue,         // "true"
    KwFalse,        // "false"

    Tilde,          // ~
    AndAnd,         // &&
    OrOr,           // ||
    FatArrow,       // =>

    LParen,         // (
    RParen,         // )

    Eof
};

/// Human-readable name for debugging.
const char* token_kind_name(TokenKind k) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    SourcePos   pos;
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Stores the full input and lazily produces tokens via next().

class Lexer {
public:
    /// Construct a lexer over the given input.
    /// @param source  the full text to tokenise
    /// @param line    the starting line number (default 1)
    explicit Lexer(std::string_view source, std::uint32_t line = 1);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

private:
    void skip_whitespace();
    bool at_symbol() const noexcept;
    Token read_term_or_keyword();
    Token make_symbol(TokenKind kind, std::size_t length);

    std::string_view src_;
    std::size_t      idx_ = 0;
    SourcePos        pos_;
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Tokenise a complete string and return a vector of tokens (including the
// trailing Eof).  Throws LexError on empty or whitespace-only input.

std::vector<Token> tokenise(std::string_view source, std::uint32_t line = 1);

}  // namespace normform

#endif  // NORMFORM_LEXER_HPP
