// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "normform/cli.hpp"
#include "normform/ast.hpp"
#include "normform/converter.hpp"
#include "normform/printer.hpp"
#include "normform/simplify.hpp"
#include "normform/test.hpp"
#include "normform/utils.hpp"
#include "normform/z3_checker.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace normform {

namespace {

NormalForm parse_mode(const std::string& arg) {
    std::string mode = to_lower(arg);
    if (mode == "dnf") return NormalForm::Dnf;
    if (mode == "cnf") return NormalForm::Cnf;
    throw std::runtime_error("unknown output form '" + arg + "' (expected cnf or dnf)");
}

// Clause and literal counts of a normal-form formula.  A bare constant
// counts as zero clauses.
std::pair<std::size_t, std::size_t> count_clauses(FormulaId id, NormalForm form,
                                                  const FormulaFactory& f) {
    NodeKind k = f.kind(id);
    if (k == NodeKind::True || k == NodeKind::False) return {0, 0};
    std::size_t literals = 0;
    std::vector<FormulaSet> clauses = collect_clauses(id, form, f);
    for (const FormulaSet& c : clauses) literals += c.size();
    return {clauses.size(), literals};
}

}  // namespace

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;
    std::vector<std::string> positional;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done) {
            positional.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--verify") {
            opts.verify = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--dnf") {
            opts.form = NormalForm::Dnf;
        } else if (arg == "--cnf") {
            opts.form = NormalForm::Cnf;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--file" || arg == "-f") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--file requires a path argument");
            }
            opts.file = argv[++i];
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    // Sentence first (unless --file), then the optional output form.
    std::size_t next = 0;
    if (opts.file.empty() && next < positional.size()) {
        opts.sentence = positional[next++];
    }
    if (next < positional.size()) {
        opts.form = parse_mode(positional[next++]);
    }
    if (next < positional.size()) {
        throw std::runtime_error("unexpected argument: " + positional[next]);
    }

    // Validate: need --selftest, a sentence or a file.
    if (!opts.selftest && !opts.help && opts.file.empty() && opts.sentence.empty()) {
        throw std::runtime_error("no sentence specified (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name, std::ostream& out) {
    out
        << "Usage: " << program_name << " [OPTIONS] <sentence> [dnf]\n"
        << "       " << program_name << " [OPTIONS] --file <formulas.txt> [dnf]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Converts a propositional sentence to simplified CNF (default) or DNF.\n"
        << "\n"
        << "Syntax (tightest first):  ~  &&  ||  =>   with ( ) for grouping.\n"
        << "Everything else, up to whitespace or a symbol, is a term.\n"
        << "'true' and 'false' are constants, so no proposition can be named\n"
        << "'true' or 'false'.  '=>' is right-associative.\n"
        << "\n"
        << "Options:\n"
        << "  dnf | cnf       Output form (positional, case-insensitive)\n"
        << "  --dnf, --cnf    Same as the positional form\n"
        << "  --file <path>, -f <path>\n"
        << "                  Convert every line of a file; '#' starts a comment\n"
        << "  --verify        Check each result against the input with Z3\n"
        << "  --stats         Show clause and literal counts\n"
        << "  --trace         Print every pipeline stage to stderr\n"
        << "  --selftest      Run built-in tests\n"
        << "  --help, -h      Show this message\n"
        << "  --              End of options (for sentences starting with '-')\n"
        << "\n"
        << "Examples:\n"
        << "  " << program_name << " 'a => b && ~c'        prints (~a || b) && (~a || ~c)\n"
        << "  " << program_name << " 'a => b && c' dnf     prints ~a || b && c\n";
}

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    // ── Collect the sentences, with their line numbers ──────────────────
    std::vector<NumberedSentence> sentences;
    const bool from_file = !opts.file.empty();

    if (from_file) {
        try {
            sentences = read_sentence_file(opts.file);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    } else {
        sentences.push_back(NumberedSentence{1, opts.sentence});
    }

    // ── Process each sentence ───────────────────────────────────────────
    FormulaFactory factory;
    bool had_errors = false;

    for (const auto& [line_num, content] : sentences) {
        try {
            Conversion conv = convert(content, opts.form, factory, line_num);

            if (opts.trace) {
                std::cerr << "[" << line_num << "] parsed:      " << render(conv.parsed, factory) << "\n"
                          << "[" << line_num << "] nnf:         " << render(conv.nnf, factory) << "\n"
                          << "[" << line_num << "] "
                          << normal_form_name(opts.form) << ":         "
                          << render(conv.distributed, factory) << "\n"
                          << "[" << line_num << "] simplified:  " << conv.text << "\n";
            }

            if (from_file) {
                std::cout << line_num << ": " << conv.text << "\n";
            } else {
                std::cout << conv.text << "\n";
            }

            if (opts.show_stats) {
                auto [raw_clauses, raw_literals] = count_clauses(conv.distributed, opts.form, factory);
                auto [clauses, literals] = count_clauses(conv.simplified, opts.form, factory);
                std::cout << "  Stats: " << normal_form_name(opts.form)
                          << " clauses " << raw_clauses << " -> " << clauses
                          << ", literals " << raw_literals << " -> " << literals
                          << ", formula nodes " << factory.size() << "\n";
            }

            if (opts.verify) {
                EquivalenceChecker checker(factory);
                EquivalenceResult r = checker.check(conv.parsed, conv.simplified);
                if (r.verdict != Equivalence::Equivalent) {
                    std::cerr << line_num << ": ERROR: verification failed, result is "
                              << equivalence_name(r.verdict) << " to the input";
                    if (!r.counterexample.empty()) {
                        std::cerr << " (counterexample " << r.counterexample << ")";
                    }
                    std::cerr << "\n";
                    had_errors = true;
                } else if (opts.trace) {
                    std::cerr << "[" << line_num << "] verified:    equivalent\n";
                }
            }

        } catch (const std::exception& e) {
            // Lex and parse errors already include line/column.
            std::cerr << e.what() << "\n";
            had_errors = true;
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace normform
