/**
 * Motif Scanner - Transcription Factor Binding Occupancy
 *
 * Predicts where a transcription factor binds along DNA sequences, and with
 * what probability, from a position weight matrix and a statistical
 * thermodynamics binding model with a tunable chemical potential.
 *
 * This header carries the types shared by every component:
 * - Strand / BindingSite / SequenceRecord
 * - Run parameters (mu, cutoff)
 * - Error types
 * - Logging
 */

#ifndef TFBS_SCANNER_HPP
#define TFBS_SCANNER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#define TFBS_VERSION "1.0.0"

namespace tfbs {

/**
 * DNA strand of a binding site
 */
enum class Strand {
    FORWARD,
    REVERSE
};

/**
 * Single-character strand code used in result tables ('F' or 'R')
 */
char strand_to_char(Strand strand);

/**
 * Parse a strand code ('F'/'R', '+'/'-'); throws std::invalid_argument otherwise
 */
Strand strand_from_char(char c);

/**
 * One labelled input sequence
 */
struct SequenceRecord {
    std::string label;
    std::string sequence;
};

/**
 * Scan result row.
 *
 * position is the 0-based index of the leftmost base of the window in the
 * forward-strand sequence, for both strands.
 */
struct BindingSite {
    std::string label;
    std::size_t position = 0;
    std::string motif;
    Strand strand = Strand::FORWARD;
    std::size_t motif_length = 0;
    double occupancy = 0.0;
};

/**
 * Deterministic ordering of sites within a sequence:
 * position, then motif name, then strand (forward first).
 */
bool site_order_less(const BindingSite& a, const BindingSite& b);

/**
 * Run parameters for the occupancy model
 */
struct ScanParams {
    double mu = 9.0;        // Chemical potential
    double cutoff = 0.2;    // Minimum occupancy to retain a site
};

/**
 * Throws InvalidParameterError if mu is not finite or cutoff is outside [0, 1]
 */
void validate_scan_params(const ScanParams& params);

// ============================================================================
// Errors
// ============================================================================

/**
 * A motif's PWM is structurally invalid (rows not summing to 1, incomplete
 * alphabet, negative values, declared shape mismatch).
 */
class MalformedMatrixError : public std::runtime_error {
public:
    MalformedMatrixError(const std::string& motif_name, const std::string& message);

    const std::string& motif_name() const { return motif_name_; }

private:
    std::string motif_name_;
};

/**
 * Input file cannot be read or does not have the expected structure
 */
class FileFormatError : public std::runtime_error {
public:
    explicit FileFormatError(const std::string& message);
};

/**
 * Non-ACGT symbol in a context that requires strict DNA
 */
class InvalidSequenceError : public std::runtime_error {
public:
    InvalidSequenceError(std::size_t position, const std::string& message);

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

/**
 * Run parameter outside its valid range
 */
class InvalidParameterError : public std::runtime_error {
public:
    InvalidParameterError(const std::string& name, const std::string& value,
                          const std::string& message);

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }

private:
    std::string name_;
    std::string value_;
};

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

/**
 * Human-readable duration: "850 ms", "12.3 s", "4m 5s", "1h 2m 3s"
 */
std::string format_duration_ms(int64_t ms);

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(const std::chrono::time_point<Clock, DurA>& start,
                                  const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(static_cast<int64_t>(ms));
}

} // namespace tfbs

#endif // TFBS_SCANNER_HPP
