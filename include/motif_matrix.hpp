/**
 * Motif Matrices
 *
 * - MatrixConverter: PWM (base frequencies) -> EWM (relative binding energies)
 * - MotifMatrix: one transcription factor's PWM with its cached EWM
 * - MotifCollection: motifs indexed by name
 */

#ifndef MOTIF_MATRIX_HPP
#define MOTIF_MATRIX_HPP

#include "sequence_utils.hpp"
#include <array>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tfbs {

using MatrixRow = std::array<double, ALPHABET_SIZE>;
using Matrix = std::vector<MatrixRow>;

/**
 * What an energy is measured relative to
 */
enum class EnergyReference {
    BACKGROUND,   // -ln(p / background)
    CONSENSUS     // -ln(p / max(p)), consensus base has energy 0
};

std::string energy_reference_to_string(EnergyReference ref);

/**
 * Parse "background" or "consensus"; throws InvalidParameterError otherwise
 */
EnergyReference parse_energy_reference(const std::string& name);

/**
 * Uniform background, 0.25 per base
 */
MatrixRow uniform_background();

/**
 * Conversion settings
 */
struct ConverterOptions {
    MatrixRow background = uniform_background();
    double pseudocount = 1e-4;      // Frequency floor applied before the log
    double tolerance = 0.01;        // Allowed deviation of a row sum from 1
    EnergyReference reference = EnergyReference::BACKGROUND;
    double rt = 1.0;                // Energy scale (RT); 2.5 gives kJ/mol at ~300K
};

/**
 * Validate options and return a copy with the background normalized to sum 1.
 * Throws InvalidParameterError.
 */
ConverterOptions normalize_options(const ConverterOptions& options);

/**
 * Converts PWM rows into EWM rows with a log-odds transform.
 *
 * Pure: the same row always yields the same energies. Rows are validated
 * first and MalformedMatrixError is thrown for structurally invalid input.
 */
class MatrixConverter {
public:
    explicit MatrixConverter(const ConverterOptions& options = ConverterOptions());

    /**
     * Check that a row is a probability distribution over the alphabet
     * @param motif_name Used in the error message
     * @param row_index Used in the error message
     */
    void validate_row(const MatrixRow& row, const std::string& motif_name,
                      std::size_t row_index) const;

    MatrixRow convert_row(const MatrixRow& pwm_row, const std::string& motif_name,
                          std::size_t row_index = 0) const;

    Matrix convert(const Matrix& pwm, const std::string& motif_name) const;

    const ConverterOptions& options() const { return options_; }

private:
    ConverterOptions options_;
};

/**
 * One transcription factor's positional base preference.
 *
 * Immutable after construction: the EWM is derived eagerly from the PWM
 * and never modified.
 */
class MotifMatrix {
public:
    /**
     * @param name Motif identifier
     * @param pwm Frequency rows, one per motif position
     * @param converter Converter used to derive the EWM
     * @throws MalformedMatrixError for an empty or invalid PWM
     */
    MotifMatrix(std::string name, Matrix pwm,
                const MatrixConverter& converter = MatrixConverter());

    MotifMatrix(std::string name, std::string alt_name, int nsites, Matrix pwm,
                const MatrixConverter& converter = MatrixConverter());

    /**
     * Build a motif directly from energies (no PWM). Used for hand-built
     * energy models; the energies are taken as-is.
     * @throws MalformedMatrixError for an empty matrix or non-finite energies
     */
    static MotifMatrix from_energies(std::string name, Matrix ewm);

    const std::string& name() const { return name_; }
    const std::string& alt_name() const { return alt_name_; }
    int nsites() const { return nsites_; }
    std::size_t width() const { return ewm_.size(); }

    bool has_pwm() const { return !pwm_.empty(); }
    const Matrix& pwm() const { return pwm_; }
    const Matrix& ewm() const { return ewm_; }

    /**
     * Least favorable (maximum) energy at a motif position; scored for
     * ambiguous bases
     */
    double worst_energy(std::size_t position) const { return worst_energy_[position]; }

    /**
     * Most favorable total energy over all windows (sum of row minima)
     */
    double best_total_energy() const;

    /**
     * Consensus sequence (lowest-energy base per position)
     */
    std::string consensus() const;

    /**
     * True if the EWM equals its own reverse complement within tolerance
     */
    bool is_palindromic(double tolerance = 1e-9) const;

private:
    MotifMatrix() = default;

    void cache_worst_energies();

    std::string name_;
    std::string alt_name_;
    int nsites_ = 0;
    Matrix pwm_;
    Matrix ewm_;
    std::vector<double> worst_energy_;
};

/**
 * Motifs keyed by name; ordered so iteration is deterministic
 */
using MotifCollection = std::map<std::string, MotifMatrix>;

/**
 * Read-only collection shared across parallel workers
 */
using SharedMotifCollection = std::shared_ptr<const MotifCollection>;

} // namespace tfbs

#endif // MOTIF_MATRIX_HPP
