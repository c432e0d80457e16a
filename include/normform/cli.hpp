// ============================================================================
// normform/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: read sentence(s) → parse → normalise → distribute → simplify →
// print.
//
// ============================================================================

#ifndef NORMFORM_CLI_HPP
#define NORMFORM_CLI_HPP

#include "normform/normal_form.hpp"

#include <iostream>
#include <string>

namespace normform {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string sentence;                 // formula text (empty with --file)
    std::string file;                     // path given with --file
    NormalForm  form = NormalForm::Cnf;
    bool        selftest = false;
    bool        verify = false;           // cross-check each result with Z3
    bool        show_stats = false;
    bool        trace = false;            // dump every pipeline stage to stderr
    bool        help = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information (stderr unless another stream is given).
void print_usage(const char* program_name, std::ostream& out = std::cerr);

/// Main driver: convert the sentence (or every line of the file) and print
/// the results.  Returns the process exit code (0 = ok, 1 = errors).
int run(const Options& opts);

}  // namespace normform

#endif  // NORMFORM_CLI_HPP
