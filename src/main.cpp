/**
 * Motif Scanner - Main Entry Point
 *
 * Predicts transcription factor binding occupancy for every position and
 * strand of a batch of DNA sequences.
 */

#include "cli.hpp"
#include "tfbs_scanner.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    tfbs::cli::Options opts;
    try {
        opts = tfbs::cli::parse_args(argc, argv);
    } catch (const tfbs::cli::ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n" << std::endl;
            tfbs::cli::print_usage(argv[0]);
        }
        return e.exit_code();
    }

    // Set log level
    tfbs::set_log_level(opts.log_level);

    try {
        return tfbs::cli::run_scan(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
