// ============================================================================
// main.cpp — normform: propositional sentence to simplified CNF / DNF
// ============================================================================
//
//   normform 'a => b && ~c'          (~a || b) && (~a || ~c)
//   normform 'a => b && c' dnf       ~a || b && c
//
// Exit status: 0 when every sentence converted (and verified, with
// --verify), 1 on a usage, lex or parse error or a failed verification.
//
// ============================================================================

#include "normform/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        normform::Options opts = normform::parse_args(argc, argv);

        // Requested help is normal output; usage after an error is not.
        if (opts.help) {
            normform::print_usage(argv[0], std::cout);
            return 0;
        }

        return normform::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        normform::print_usage(argv[0]);
        return 1;
    }
}
