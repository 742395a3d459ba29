// ============================================================================
// main.cpp - Entry point for the smtsym tool
// ============================================================================

#include "smtsym/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        smtsym::Options opts = smtsym::parse_args(argc, argv);

        if (opts.help) {
            smtsym::print_usage(argv[0]);
            return 0;
        }

        return smtsym::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        smtsym::print_usage(argv[0]);
        return 1;
    }
}
