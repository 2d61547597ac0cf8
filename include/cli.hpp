/**
 * Command-line interface for motif-scanner
 */

#ifndef CLI_HPP
#define CLI_HPP

#include "tfbs_scanner.hpp"
#include "motif_matrix.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace tfbs {
namespace cli {

struct Options {
    std::string data_file;                  // CSV/TSV table or FASTA
    std::string pwm_file;                   // MEME motif file
    std::string output_file;                // Site table ("-" for stdout)

    ScanParams params;
    ConverterOptions converter;
    bool meme_background = false;           // Use the MEME file's background

    std::string format;                     // csv | tsv | json; empty = from extension
    std::string landscape_file;             // Optional dense landscape table
    std::string summary_file;               // Optional per-sequence summary
    std::vector<std::string> restriction_sites;
    std::vector<std::string> motifs;        // Restrict scan to these motifs; empty = all

    int threads = 0;                        // 0 = all available
    LogLevel log_level = LogLevel::INFO;
};

/**
 * Thrown by parse_args to end the program: code 0 after --help/--version,
 * code 1 for usage errors (message already formatted for stderr)
 */
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Print version string to stdout
void print_version();

// Print usage/help to stdout
void print_usage(const char* program_name);

/**
 * Parse command-line arguments into Options
 * @throws ParseArgsExit for --help/--version and usage errors
 */
Options parse_args(int argc, char* argv[]);

/**
 * Parse "--background": four comma-separated values in A,C,G,T order, or
 * "A:x,C:x,G:x,T:x" in any order
 * @throws std::invalid_argument
 */
MatrixRow parse_background(const std::string& value);

/**
 * Split a comma-separated list, trimming blanks and dropping empty items
 */
std::vector<std::string> split_list(const std::string& value);

/**
 * Keep only the named motifs; throws InvalidParameterError for unknown names
 */
MotifCollection select_motifs(const MotifCollection& motifs,
                              const std::vector<std::string>& names);

/**
 * Load inputs, scan, write outputs
 * @return process exit code
 */
int run_scan(const Options& opts);

} // namespace cli
} // namespace tfbs

#endif // CLI_HPP
