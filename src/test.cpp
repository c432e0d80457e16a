// ============================================================================
// test.cpp — Self-test suite for the normform tool
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation (longest match, verbatim terms, positions)
//   - Parser precedence, associativity and error reporting
//   - Implication elimination and NNF
//   - CNF / DNF distribution shape
//   - Simplification (duplicates, complements, constants, absorption)
//   - Minimal-parenthesis rendering and parse/render round trips
//   - Semantic equivalence of every conversion, by exhaustive truth table
//     and by Z3
//   - Command-line argument handling and sentence files
//
// ============================================================================

#include "normform/test.hpp"
#include "normform/ast.hpp"
#include "normform/cli.hpp"
#include "normform/converter.hpp"
#include "normform/lexer.hpp"
#include "normform/normal_form.hpp"
#include "normform/normalization.hpp"
#include "normform/parser.hpp"
#include "normform/printer.hpp"
#include "normform/simplify.hpp"
#include "normform/utils.hpp"
#include "normform/z3_checker.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace normform {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_contains(const std::string& text,
                                 const std::string& needle,
                                 const std::string& description) {
    ++total_;
    if (text.find(needle) == std::string::npos) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected to contain: " << needle << "\n"
                  << "    actual:              " << text << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::section(const std::string& title) {
    std::cerr << "\n--- " << title << " ---\n";
}

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

// Parse and pretty-print fully parenthesised.
static std::string pp(const std::string& input) {
    FormulaFactory f;
    FormulaId id = parse_formula(input, f);
    return f.to_string(id);
}

static std::string normalized(const std::string& input) {
    FormulaFactory f;
    FormulaId id = normalize(parse_formula(input, f), f);
    return f.to_string(id);
}

static std::string cnf(const std::string& input) {
    return convert_to_string(input, NormalForm::Cnf);
}

static std::string dnf(const std::string& input) {
    return convert_to_string(input, NormalForm::Dnf);
}

// Reason of the ParseError / LexError raised by `input`, or "" if it parses.
static std::string parse_error(const std::string& input, SourcePos* pos = nullptr) {
    FormulaFactory f;
    try {
        parse_formula(input, f);
    } catch (const ParseError& e) {
        if (pos) *pos = e.position();
        return e.reason();
    } catch (const LexError& e) {
        if (pos) *pos = e.position();
        return e.reason();
    }
    return "";
}

// Truth-table evaluation; test-only, the tool itself never enumerates
// assignments.
static bool evaluate(FormulaId id, const FormulaFactory& f,
                     const std::map<std::string, bool>& assignment) {
    const FormulaNode& n = f.node(id);
    switch (n.kind) {
        case NodeKind::True:    return true;
        case NodeKind::False:   return false;
        case NodeKind::Term:    return assignment.at(n.term_name);
        case NodeKind::Not:     return !evaluate(n.children[0], f, assignment);
        case NodeKind::And:     return evaluate(n.children[0], f, assignment) &&
                                       evaluate(n.children[1], f, assignment);
        case NodeKind::Or:      return evaluate(n.children[0], f, assignment) ||
                                       evaluate(n.children[1], f, assignment);
        case NodeKind::Implies: return !evaluate(n.children[0], f, assignment) ||
                                       evaluate(n.children[1], f, assignment);
    }
    throw std::logic_error("evaluate: bad node kind");
}

static void collect_terms(FormulaId id, const FormulaFactory& f,
                          std::set<std::string>& out) {
    const FormulaNode& n = f.node(id);
    if (n.kind == NodeKind::Term) {
        out.insert(n.term_name);
        return;
    }
    for (FormulaId c : n.children) {
        if (c != kInvalidId) collect_terms(c, f, out);
    }
}

// Exhaustive comparison over the terms of `a` (the output never introduces
// new terms, but may drop some).
static bool truth_table_equivalent(FormulaId a, FormulaId b, const FormulaFactory& f) {
    std::set<std::string> names;
    collect_terms(a, f, names);
    collect_terms(b, f, names);
    std::vector<std::string> terms(names.begin(), names.end());

    const std::uint64_t rows = std::uint64_t{1} << terms.size();
    for (std::uint64_t row = 0; row < rows; ++row) {
        std::map<std::string, bool> assignment;
        for (std::size_t i = 0; i < terms.size(); ++i) {
            assignment[terms[i]] = ((row >> i) & 1U) != 0;
        }
        if (evaluate(a, f, assignment) != evaluate(b, f, assignment)) {
            return false;
        }
    }
    return true;
}

// Sentences exercised by the property tests.
static const std::vector<std::string>& corpus() {
    static const std::vector<std::string> sentences = {
        "a",
        "~a",
        "a && b",
        "a || b",
        "a => b",
        "a => b && c",
        "a => b && ~c",
        "a => b => c",
        "(a => b) => c",
        "(a || b) && (c || d)",
        "(a && b) || (c && d)",
        "~(a && (b || ~c))",
        "~(a => b) || c && d",
        "(p1 || q1) && (p2 || q2) && (p3 || q3)",
        "(p1 && q1) || (p2 && q2) || (p3 && q3)",
        "a && ~a",
        "a || ~a",
        "true",
        "false",
        "~true || a",
        "a && false || b",
        "x.y => ~(x.y && z)",
        "(a || b || c) && (~a || ~b) && (~c || a)",
        "~~~a",
        "(a => b) && (b => c) && (c => a)",
        "(a || b) && (a || ~b) && (~a || b)",
        "~((a || b) && (c || d)) => (e && ~f)",
        "((A && B) || C) => (D || ~(E && F && G))",
    };
    return sentences;
}

// ============================================================================
// Lexer tests
// ============================================================================

static void test_lexer_symbols(TestContext& ctx) {
    auto toks = tokenise("a && b || ~c => (d)");
    std::vector<TokenKind> expected = {
        TokenKind::Term, TokenKind::AndAnd, TokenKind::Term, TokenKind::OrOr,
        TokenKind::Tilde, TokenKind::Term, TokenKind::FatArrow, TokenKind::LParen,
        TokenKind::Term, TokenKind::RParen, TokenKind::Eof};
    ctx.check(toks.size() == expected.size(), "token count");
    for (std::size_t i = 0; i < toks.size() && i < expected.size(); ++i) {
        ctx.check(toks[i].kind == expected[i],
                  "token " + std::to_string(i) + " is " + token_kind_name(expected[i]));
    }
}

static void test_lexer_longest_match(TestContext& ctx) {
    auto toks = tokenise("a=>b");
    ctx.check(toks.size() == 4, "a=>b gives three tokens");
    ctx.check_eq(toks[0].text, "a", "term before =>");
    ctx.check(toks[1].kind == TokenKind::FatArrow, "=> is one token");
    ctx.check_eq(toks[2].text, "b", "term after =>");

    auto no_space = tokenise("~a&&b||c");
    ctx.check(no_space.size() == 7, "operators split terms without spaces");
    ctx.check_eq(no_space[1].text, "a", "~ ends before a");
    ctx.check(no_space[2].kind == TokenKind::AndAnd, "&& recognised");
    ctx.check(no_space[4].kind == TokenKind::OrOr, "|| recognised");
}

static void test_lexer_verbatim_terms(TestContext& ctx) {
    ctx.check_eq(tokenise("a&b")[0].text, "a&b", "lone & belongs to the term");
    ctx.check_eq(tokenise("x|y")[0].text, "x|y", "lone | belongs to the term");
    ctx.check_eq(tokenise("a=b")[0].text, "a=b", "lone = belongs to the term");
    ctx.check_eq(tokenise("p.q_1")[0].text, "p.q_1", "punctuation in term");
    ctx.check_eq(tokenise("x>=3")[0].text, "x>=3", "comparison text is a term");

    auto toks = tokenise("Rain rain");
    ctx.check(toks[0].text != toks[1].text, "terms are case-sensitive");
}

static void test_lexer_keywords(TestContext& ctx) {
    ctx.check(tokenise("true")[0].kind == TokenKind::KwTrue, "true keyword");
    ctx.check(tokenise("false")[0].kind == TokenKind::KwFalse, "false keyword");
    ctx.check(tokenise("True")[0].kind == TokenKind::Term, "True is a term");
    ctx.check(tokenise("trueish")[0].kind == TokenKind::Term, "trueish is a term");
}

static void test_lexer_positions(TestContext& ctx) {
    auto toks = tokenise("  a\t&&\n b ");
    ctx.check(toks[0].pos.line == 1 && toks[0].pos.column == 3, "a at 1:3");
    ctx.check(toks[1].pos.line == 1 && toks[1].pos.column == 5, "&& at 1:5");
    ctx.check(toks[2].pos.line == 2 && toks[2].pos.column == 2, "b at 2:2");

    auto on_line = tokenise("p", 7);
    ctx.check(on_line[0].pos.line == 7, "starting line is honoured");
}

static void test_lexer_next_stream(TestContext& ctx) {
    Lexer lex("(p || q)", 2);
    std::vector<TokenKind> kinds;
    for (Token t = lex.next(); t.kind != TokenKind::Eof; t = lex.next()) {
        kinds.push_back(t.kind);
    }
    ctx.check(kinds.size() == 5, "five tokens before Eof");

    Token eof = lex.next();
    ctx.check(eof.kind == TokenKind::Eof, "Eof repeats after the end");
    ctx.check(eof.pos.line == 2 && eof.pos.column == 9, "Eof positioned past the input");

    Lexer blank("   ");
    ctx.check(blank.next().kind == TokenKind::Eof, "Lexer itself accepts blank input");
}

static void test_lexer_empty_input(TestContext& ctx) {
    std::string msg = ctx.check_throws<LexError>([] { tokenise(""); },
                                                 "empty input raises LexError");
    ctx.check_eq(msg, "1: ERROR: empty input at column 1", "formatted message");

    ctx.check_throws<LexError>([] { tokenise(" \t  "); },
                               "whitespace-only input raises LexError");
    ctx.check_throws<LexError>([] { tokenise("\n\n", 3); },
                               "newlines only raise LexError");
}

// ============================================================================
// Parser tests
// ============================================================================

static void test_parse_terms(TestContext& ctx) {
    ctx.check_eq(pp("a"), "a", "single term");
    ctx.check_eq(pp("~a"), "(~a)", "negated term");
    ctx.check_eq(pp("((a))"), "a", "redundant parentheses");
    ctx.check_eq(pp("~~a"), "(~(~a))", "double negation is kept by the parser");
    ctx.check_eq(pp("true && false"), "(true && false)", "constants");
}

static void test_parse_precedence(TestContext& ctx) {
    FormulaFactory f;
    FormulaId plain   = parse_formula("a => b && c", f);
    FormulaId grouped = parse_formula("a => (b && c)", f);
    FormulaId wrong   = parse_formula("(a => b) && c", f);
    ctx.check(plain == grouped, "a => b && c  ==  a => (b && c)");
    ctx.check(plain != wrong, "a => b && c  !=  (a => b) && c");

    ctx.check(parse_formula("a || b && c", f) == parse_formula("a || (b && c)", f),
              "&& binds tighter than ||");
    ctx.check(parse_formula("~a && b", f) == parse_formula("(~a) && b", f),
              "~ binds tighter than &&");
    ctx.check(parse_formula("a || b => c", f) == parse_formula("(a || b) => c", f),
              "|| binds tighter than =>");
    ctx.check(parse_formula("~a || b", f) != parse_formula("~(a || b)", f),
              "~ applies to the smallest unit");
}

static void test_parse_associativity(TestContext& ctx) {
    FormulaFactory f;
    ctx.check(parse_formula("a && b && c", f) == parse_formula("(a && b) && c", f),
              "&& is left-associative");
    ctx.check(parse_formula("a || b || c", f) == parse_formula("(a || b) || c", f),
              "|| is left-associative");
    ctx.check(parse_formula("a => b => c", f) == parse_formula("a => (b => c)", f),
              "=> is right-associative");
    ctx.check(parse_formula("a => b => c", f) != parse_formula("(a => b) => c", f),
              "=> chain is not left-grouped");
}

static void test_parse_errors(TestContext& ctx) {
    SourcePos pos;

    ctx.check_contains(parse_error("a &&", &pos), "missing right operand for '&&'",
                       "a && : missing right operand");
    ctx.check(pos.column == 5, "a && : reported at end of input");

    ctx.check_contains(parse_error("&& a", &pos), "missing left operand for '&&'",
                       "&& a : missing left operand");
    ctx.check(pos.column == 1, "&& a : reported at column 1");

    ctx.check_contains(parse_error("a b", &pos), "missing operator before 'b'",
                       "a b : missing operator");
    ctx.check(pos.column == 3, "a b : reported at b");

    ctx.check_contains(parse_error("(a"), "'(' at column 1 is never closed", "(a : unclosed");
    ctx.check_contains(parse_error("a)"), "unmatched ')'", "a) : unmatched");
    ctx.check_contains(parse_error("(a && b))"), "unmatched ')'", "(a && b)) : extra close");
    ctx.check_contains(parse_error("((a || b)"), "unbalanced parentheses",
                       "((a || b) : missing close");
    ctx.check_contains(parse_error("()"), "empty parentheses", "()");
    ctx.check_contains(parse_error("~"), "missing operand for '~'", "~ alone");
    ctx.check_contains(parse_error("a => "), "missing right operand for '=>'", "a =>");
    ctx.check_contains(parse_error("a || || b"), "missing right operand for '||'", "a || || b");
    ctx.check_contains(parse_error("a (b)"), "missing operator before '('", "a (b)");
    ctx.check_contains(parse_error("   "), "empty input", "blank input");

    ctx.check(parse_error("a && (b || ~c)").empty(), "well-formed input parses");
}

static void test_parse_error_message_format(TestContext& ctx) {
    FormulaFactory f;
    try {
        parse_formula("a ||", f, 4);
        ctx.check(false, "expected ParseError");
    } catch (const ParseError& e) {
        ctx.check_eq(e.what(), "4: ERROR: missing right operand for '||' at column 5",
                     "line and column in message");
        ctx.check(e.position().line == 4, "position line");
    }
}

static void test_parser_empty_token_stream(TestContext& ctx) {
    FormulaFactory f;
    std::vector<Token> only_eof = {Token{}};
    Parser parser(only_eof, f);
    std::string msg = ctx.check_throws<ParseError>([&] { parser.parse(); },
                                                   "Eof-only stream is rejected");
    ctx.check_contains(msg, "empty expression", "reason");
}

// ============================================================================
// Normalization tests
// ============================================================================

static void test_eliminate_implications(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = eliminate_implications(parse_formula("a => b => c", f), f);
    ctx.check_eq(f.to_string(id), "((~a) || ((~b) || c))", "nested implications");
}

static void test_nnf_rules(TestContext& ctx) {
    ctx.check_eq(normalized("a => b"), "((~a) || b)", "implication");
    ctx.check_eq(normalized("~~a"), "a", "double negation");
    ctx.check_eq(normalized("~~~a"), "(~a)", "triple negation");
    ctx.check_eq(normalized("~(a && b)"), "((~a) || (~b))", "De Morgan &&");
    ctx.check_eq(normalized("~(a || b)"), "((~a) && (~b))", "De Morgan ||");
    ctx.check_eq(normalized("~(a => b)"), "(a && (~b))", "negated implication");
    ctx.check_eq(normalized("~(a && ~(b || c))"), "((~a) || (b || c))", "nested");
    ctx.check_eq(normalized("~true"), "false", "~true");
    ctx.check_eq(normalized("~false"), "true", "~false");
}

static void test_nnf_invariant(TestContext& ctx) {
    for (const auto& s : corpus()) {
        FormulaFactory f;
        FormulaId parsed = parse_formula(s, f);
        FormulaId nnf = normalize(parsed, f);
        ctx.check(is_nnf(nnf, f), "NNF shape: " + s);
        ctx.check(truth_table_equivalent(parsed, nnf, f), "NNF equivalent: " + s);
        ctx.check(normalize(nnf, f) == nnf, "NNF is a fixpoint: " + s);
    }
}

// ============================================================================
// Distribution tests
// ============================================================================

static void test_distribute_cnf(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = to_cnf(normalize(parse_formula("a || (b && c)", f), f), f);
    ctx.check_eq(f.to_string(id), "((a || b) && (a || c))", "or over and (right)");

    id = to_cnf(normalize(parse_formula("(a && b) || c", f), f), f);
    ctx.check_eq(f.to_string(id), "((a || c) && (b || c))", "or over and (left)");

    id = to_cnf(normalize(parse_formula("(a && b) || (c && d)", f), f), f);
    ctx.check_eq(f.to_string(id),
                 "(((a || c) && (a || d)) && ((b || c) && (b || d)))",
                 "four clauses");
}

static void test_distribute_dnf(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = to_dnf(normalize(parse_formula("a && (b || c)", f), f), f);
    ctx.check_eq(f.to_string(id), "((a && b) || (a && c))", "and over or");

    id = to_dnf(normalize(parse_formula("a => b && c", f), f), f);
    ctx.check_eq(f.to_string(id), "((~a) || (b && c))", "already DNF");
}

static void test_distribute_shape(TestContext& ctx) {
    for (const auto& s : corpus()) {
        FormulaFactory f;
        FormulaId parsed = parse_formula(s, f);
        FormulaId nnf = normalize(parsed, f);
        FormulaId c = to_cnf(nnf, f);
        FormulaId d = to_dnf(nnf, f);
        ctx.check(is_normal_form(c, NormalForm::Cnf, f), "CNF shape: " + s);
        ctx.check(is_normal_form(d, NormalForm::Dnf, f), "DNF shape: " + s);
        ctx.check(truth_table_equivalent(parsed, c, f), "CNF equivalent: " + s);
        ctx.check(truth_table_equivalent(parsed, d, f), "DNF equivalent: " + s);
    }
}

static void test_distribute_rejects_non_nnf(TestContext& ctx) {
    FormulaFactory f;
    FormulaId implication = parse_formula("a => b", f);
    ctx.check_throws<std::invalid_argument>([&] { to_cnf(implication, f); },
                                            "implication is not accepted by the distributor");
}

// ============================================================================
// Simplification tests
// ============================================================================

static void test_simplify_scenarios(TestContext& ctx) {
    ctx.check_eq(cnf("a => b && ~c"), "(~a || b) && (~a || ~c)", "a => b && ~c (CNF)");
    ctx.check_eq(cnf("a => b && c"), "(~a || b) && (~a || c)", "a => b && c (CNF)");
    ctx.check_eq(dnf("a => b && c"), "~a || b && c", "a => b && c (DNF)");
    ctx.check_eq(cnf("a && a"), "a", "a && a");
    ctx.check_eq(cnf("a && ~a"), "false", "a && ~a (CNF)");
    ctx.check_eq(cnf("a || ~a"), "true", "a || ~a (CNF)");
    ctx.check_eq(dnf("a && ~a"), "false", "a && ~a (DNF)");
    ctx.check_eq(dnf("a || ~a"), "true", "a || ~a (DNF)");
}

static void test_simplify_duplicates(TestContext& ctx) {
    ctx.check_eq(cnf("a || a || b"), "a || b", "duplicate literal");
    ctx.check_eq(cnf("(a || b) && (b || a)"), "a || b", "duplicate clause");
    ctx.check_eq(dnf("(a && b) || (b && a) || (a && b)"), "a && b", "duplicate term");
    ctx.check_eq(cnf("~~a || a"), "a", "duplicate after NNF");
}

static void test_simplify_complements(TestContext& ctx) {
    ctx.check_eq(cnf("(a || ~a || b) && c"), "c", "tautological clause dropped");
    ctx.check_eq(dnf("(a && ~a && b) || c"), "c", "contradictory term dropped");
    ctx.check_eq(cnf("(a || ~a) && (b || ~b)"), "true", "all clauses tautological");
    ctx.check_eq(dnf("(a && ~a) || (b && ~b)"), "false", "all terms contradictory");
    ctx.check_eq(cnf("a => a"), "true", "a => a");
}

static void test_simplify_absorption(TestContext& ctx) {
    ctx.check_eq(cnf("a && (a || b)"), "a", "CNF absorption");
    ctx.check_eq(dnf("a || (a && b)"), "a", "DNF absorption");
    ctx.check_eq(cnf("(a || b) && (a || b || c) && d"), "d && (a || b)",
                 "superset clause dropped");
}

static void test_simplify_constants(TestContext& ctx) {
    ctx.check_eq(cnf("a && true"), "a", "&& true");
    ctx.check_eq(cnf("a || false"), "a", "|| false");
    ctx.check_eq(cnf("a || true"), "true", "|| true");
    ctx.check_eq(cnf("a && false"), "false", "&& false");
    ctx.check_eq(dnf("a && true"), "a", "DNF && true");
    ctx.check_eq(dnf("a || true"), "true", "DNF || true");
    ctx.check_eq(cnf("true"), "true", "true alone");
    ctx.check_eq(dnf("false"), "false", "false alone");
    ctx.check_eq(cnf("~true || a"), "a", "~true folds to false");
    ctx.check_eq(cnf("false => a"), "true", "ex falso");
}

static void test_simplify_ordering(TestContext& ctx) {
    ctx.check_eq(cnf("c || ~b || a"), "a || ~b || c", "literals sorted by name");
    ctx.check_eq(cnf("(c || d) && b && (a || e)"), "b && (a || e) && (c || d)",
                 "clauses sorted by size then literals");
    ctx.check_eq(cnf("~a || a"), "true", "complement in either order");

    // Interning order must not leak into the output.
    FormulaFactory f;
    parse_formula("z && y && x", f);
    ctx.check_eq(convert("x || y || z", NormalForm::Cnf, f).text, "x || y || z",
                 "output independent of factory history");
}

static void test_simplify_idempotent(TestContext& ctx) {
    for (const auto& s : corpus()) {
        for (NormalForm form : {NormalForm::Cnf, NormalForm::Dnf}) {
            FormulaFactory f;
            Conversion c = convert(s, form, f);
            FormulaId again = simplify(c.simplified, form, f);
            ctx.check(again == c.simplified,
                      std::string("idempotent ") + normal_form_name(form) + ": " + s);
            ctx.check(is_normal_form(c.simplified, form, f),
                      std::string("shape kept ") + normal_form_name(form) + ": " + s);
        }
    }
}

static void test_simplify_no_complementary_literals(TestContext& ctx) {
    for (const auto& s : corpus()) {
        for (NormalForm form : {NormalForm::Cnf, NormalForm::Dnf}) {
            FormulaFactory f;
            Conversion c = convert(s, form, f);
            NodeKind k = f.kind(c.simplified);
            if (k == NodeKind::True || k == NodeKind::False) continue;

            auto clauses = collect_clauses(c.simplified, form, f);
            bool clean = true;
            for (const FormulaSet& clause : clauses) {
                for (FormulaId lit : clause.elements()) {
                    if (clause.contains(f.complement(lit))) clean = false;
                }
            }
            for (std::size_t i = 0; i < clauses.size(); ++i) {
                for (std::size_t j = i + 1; j < clauses.size(); ++j) {
                    if (clauses[i] == clauses[j]) clean = false;
                }
            }
            ctx.check(clean, std::string("clean clauses ") + normal_form_name(form) + ": " + s);
        }
    }
}

// ============================================================================
// Rendering tests
// ============================================================================

static std::string rendered(const std::string& input) {
    FormulaFactory f;
    return render(parse_formula(input, f), f);
}

static void test_render_minimal_parens(TestContext& ctx) {
    ctx.check_eq(rendered("(a && b) || c"), "a && b || c", "no parens for tighter &&");
    ctx.check_eq(rendered("a && (b || c)"), "a && (b || c)", "parens for looser ||");
    ctx.check_eq(rendered("~(a || b)"), "~(a || b)", "negated disjunction");
    ctx.check_eq(rendered("~ ~ a"), "~~a", "stacked negation");
    ctx.check_eq(rendered("(a => b) => c"), "(a => b) => c", "left-nested implication");
    ctx.check_eq(rendered("a => (b => c)"), "a => b => c", "right-nested implication");
    ctx.check_eq(rendered("(a && b) && c"), "a && b && c", "left-nested conjunction");
    ctx.check_eq(rendered("a || (b || c)"), "a || (b || c)", "right-nested disjunction");
    ctx.check_eq(rendered("((a))"), "a", "redundant parens removed");
    ctx.check_eq(rendered("a=>b&&c"), "a => b && c", "one space around operators");
    ctx.check_eq(rendered("(a => b) || c"), "(a => b) || c", "implication inside ||");
}

static void test_render_round_trip(TestContext& ctx) {
    for (const auto& s : corpus()) {
        FormulaFactory f;
        FormulaId parsed = parse_formula(s, f);
        std::string text = render(parsed, f);
        ctx.check(parse_formula(text, f) == parsed, "round trip: " + s + "  ->  " + text);

        for (NormalForm form : {NormalForm::Cnf, NormalForm::Dnf}) {
            Conversion c = convert(s, form, f);
            ctx.check(parse_formula(c.text, f) == c.simplified,
                      std::string("output re-parses ") + normal_form_name(form) + ": " + c.text);
        }
    }
}

// ============================================================================
// Equivalence tests
// ============================================================================

static void test_truth_table_equivalence(TestContext& ctx) {
    for (const auto& s : corpus()) {
        for (NormalForm form : {NormalForm::Cnf, NormalForm::Dnf}) {
            FormulaFactory f;
            Conversion c = convert(s, form, f);
            ctx.check(truth_table_equivalent(c.parsed, c.simplified, f),
                      std::string("truth table ") + normal_form_name(form) + ": " +
                      s + "  ->  " + c.text);
        }
    }
}

static void test_z3_equivalence(TestContext& ctx) {
    for (const auto& s : corpus()) {
        for (NormalForm form : {NormalForm::Cnf, NormalForm::Dnf}) {
            FormulaFactory f;
            Conversion c = convert(s, form, f);
            EquivalenceChecker checker(f);
            EquivalenceResult r = checker.check(c.parsed, c.simplified);
            ctx.check(r.verdict == Equivalence::Equivalent,
                      std::string("z3 ") + normal_form_name(form) + ": " + s);
        }
    }
}

static void test_z3_detects_difference(TestContext& ctx) {
    FormulaFactory f;
    EquivalenceChecker checker(f);
    EquivalenceResult r = checker.check(parse_formula("a && b", f),
                                        parse_formula("a || b", f));
    ctx.check(r.verdict == Equivalence::NotEquivalent, "a && b differs from a || b");
    ctx.check_contains(r.counterexample, "a = ", "counterexample mentions a");

    ctx.check(checker.is_valid(parse_formula("a || ~a", f)), "excluded middle is valid");
    ctx.check(!checker.is_valid(parse_formula("a", f)), "a is not valid");
}

// ============================================================================
// Converter / CLI tests
// ============================================================================

static void test_convert_stages(TestContext& ctx) {
    FormulaFactory f;
    Conversion c = convert("~(a && b) => c", NormalForm::Cnf, f);
    ctx.check_eq(render(c.parsed, f), "~(a && b) => c", "parsed stage");
    ctx.check_eq(render(c.nnf, f), "a && b || c", "nnf stage");
    ctx.check(is_normal_form(c.distributed, NormalForm::Cnf, f), "distributed stage");
    ctx.check_eq(c.text, "(a || c) && (b || c)", "final text");
    ctx.check(c.form == NormalForm::Cnf, "form recorded");
}

static Options args(std::vector<std::string> argv) {
    argv.insert(argv.begin(), "normform");
    std::vector<char*> raw;
    for (auto& a : argv) raw.push_back(a.data());
    return parse_args(static_cast<int>(raw.size()), raw.data());
}

static void test_cli_arguments(TestContext& ctx) {
    Options o = args({"a && b"});
    ctx.check_eq(o.sentence, "a && b", "sentence");
    ctx.check(o.form == NormalForm::Cnf, "CNF by default");

    ctx.check(args({"a", "dnf"}).form == NormalForm::Dnf, "dnf positional");
    ctx.check(args({"a", "DNF"}).form == NormalForm::Dnf, "mode is case-insensitive");
    ctx.check(args({"a", "cnf"}).form == NormalForm::Cnf, "cnf positional");
    ctx.check(args({"--dnf", "a"}).form == NormalForm::Dnf, "--dnf flag");

    Options v = args({"--verify", "--stats", "--trace", "a"});
    ctx.check(v.verify && v.show_stats && v.trace, "flags");

    Options file = args({"--file", "in.txt", "dnf"});
    ctx.check_eq(file.file, "in.txt", "--file path");
    ctx.check(file.sentence.empty(), "no sentence with --file");
    ctx.check(file.form == NormalForm::Dnf, "mode after --file");

    ctx.check_eq(args({"--", "-x || y"}).sentence, "-x || y", "-- ends options");
    ctx.check_eq(args({"-x || y"}).sentence, "-x || y", "single dash is a sentence");
    ctx.check(args({"--selftest"}).selftest, "--selftest");
    ctx.check(args({"-h"}).help, "-h");

    ctx.check_throws<std::runtime_error>([] { args({}); }, "missing sentence");
    ctx.check_throws<std::runtime_error>([] { args({"a", "xnf"}); }, "bad mode");
    ctx.check_throws<std::runtime_error>([] { args({"a", "dnf", "extra"}); }, "too many arguments");
    ctx.check_throws<std::runtime_error>([] { args({"--bogus", "a"}); }, "unknown option");
    ctx.check_throws<std::runtime_error>([] { args({"--file"}); }, "--file without path");
}

static void test_usage_text(TestContext& ctx) {
    std::ostringstream out;
    print_usage("normform", out);
    std::string text = out.str();
    ctx.check_contains(text, "Usage: normform", "program name");
    ctx.check_contains(text, "no proposition can be named\n'true' or 'false'",
                       "reserved constant names documented");
    ctx.check_contains(text, "case-insensitive", "mode flag documented");

    // The documented examples are what the converter prints.
    ctx.check_contains(text, "prints " + cnf("a => b && ~c") + "\n", "CNF example");
    ctx.check_contains(text, "prints " + dnf("a => b && c") + "\n", "DNF example");

    // A lone 'true' is the constant, never a proposition.
    ctx.check_eq(cnf("~true"), "false", "~true is the constant false");
    ctx.check_eq(cnf("true_ish && true"), "true_ish", "longer names stay terms");
}

static void test_sentence_file(TestContext& ctx) {
    std::istringstream in(
        "# header comment\n"
        "a => b   # trailing comment\n"
        "\n"
        "   \n"
        "~(c && d)\n"
        "#\n"
        "e || f");
    std::vector<NumberedSentence> sentences = read_sentences(in);
    ctx.check(sentences.size() == 3, "three sentences");
    if (sentences.size() != 3) return;
    ctx.check(sentences[0].line == 2, "first sentence on line 2");
    ctx.check_eq(sentences[0].text, "a => b", "comment stripped");
    ctx.check(sentences[1].line == 5, "blank lines still counted");
    ctx.check_eq(sentences[1].text, "~(c && d)", "second sentence");
    ctx.check(sentences[2].line == 7, "last line without newline");

    ctx.check_throws<std::runtime_error>(
        [] { read_sentence_file("/nonexistent/normform/sentences.txt"); },
        "missing file");
    ctx.check_eq(to_lower("DnF"), "dnf", "to_lower");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    runner.section("lexer");
    runner.run("lexer_symbols",                 test_lexer_symbols);
    runner.run("lexer_longest_match",           test_lexer_longest_match);
    runner.run("lexer_verbatim_terms",          test_lexer_verbatim_terms);
    runner.run("lexer_keywords",                test_lexer_keywords);
    runner.run("lexer_positions",               test_lexer_positions);
    runner.run("lexer_next_stream",             test_lexer_next_stream);
    runner.run("lexer_empty_input",             test_lexer_empty_input);

    runner.section("parser");
    runner.run("parse_terms",                   test_parse_terms);
    runner.run("parse_precedence",              test_parse_precedence);
    runner.run("parse_associativity",           test_parse_associativity);
    runner.run("parse_errors",                  test_parse_errors);
    runner.run("parse_error_message_format",    test_parse_error_message_format);
    runner.run("parser_empty_token_stream",     test_parser_empty_token_stream);

    runner.section("normalization");
    runner.run("eliminate_implications",        test_eliminate_implications);
    runner.run("nnf_rules",                     test_nnf_rules);
    runner.run("nnf_invariant",                 test_nnf_invariant);

    runner.section("distribution");
    runner.run("distribute_cnf",                test_distribute_cnf);
    runner.run("distribute_dnf",                test_distribute_dnf);
    runner.run("distribute_shape",              test_distribute_shape);
    runner.run("distribute_rejects_non_nnf",    test_distribute_rejects_non_nnf);

    runner.section("simplification");
    runner.run("simplify_scenarios",            test_simplify_scenarios);
    runner.run("simplify_duplicates",           test_simplify_duplicates);
    runner.run("simplify_complements",          test_simplify_complements);
    runner.run("simplify_absorption",           test_simplify_absorption);
    runner.run("simplify_constants",            test_simplify_constants);
    runner.run("simplify_ordering",             test_simplify_ordering);
    runner.run("simplify_idempotent",           test_simplify_idempotent);
    runner.run("simplify_no_complementary",     test_simplify_no_complementary_literals);

    runner.section("rendering");
    runner.run("render_minimal_parens",         test_render_minimal_parens);
    runner.run("render_round_trip",             test_render_round_trip);

    runner.section("equivalence");
    runner.run("truth_table_equivalence",       test_truth_table_equivalence);
    runner.run("z3_equivalence",                test_z3_equivalence);
    runner.run("z3_detects_difference",         test_z3_detects_difference);

    runner.section("converter and cli");
    runner.run("convert_stages",                test_convert_stages);
    runner.run("cli_arguments",                 test_cli_arguments);
    runner.run("usage_text",                    test_usage_text);
    runner.run("sentence_file",                 test_sentence_file);

    return runner.summarise();
}

}  // namespace normform
