/**
 * Motif Matrices - Implementation
 */

#include "motif_matrix.hpp"
#include "tfbs_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tfbs {

namespace {

std::string format_double(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

std::string energy_reference_to_string(EnergyReference ref) {
    return ref == EnergyReference::CONSENSUS ? "consensus" : "background";
}

EnergyReference parse_energy_reference(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "background") return EnergyReference::BACKGROUND;
    if (lower == "consensus") return EnergyReference::CONSENSUS;
    throw InvalidParameterError("reference", name, "expected 'background' or 'consensus'");
}

MatrixRow uniform_background() {
    return MatrixRow{{0.25, 0.25, 0.25, 0.25}};
}

ConverterOptions normalize_options(const ConverterOptions& options) {
    ConverterOptions result = options;

    if (!std::isfinite(options.pseudocount) || options.pseudocount <= 0.0 ||
        options.pseudocount >= 1.0) {
        throw InvalidParameterError("pseudocount", format_double(options.pseudocount),
                                    "must be within (0, 1)");
    }
    if (!std::isfinite(options.tolerance) || options.tolerance < 0.0) {
        throw InvalidParameterError("tolerance", format_double(options.tolerance),
                                    "must be non-negative");
    }
    if (!std::isfinite(options.rt) || options.rt <= 0.0) {
        throw InvalidParameterError("rt", format_double(options.rt), "must be positive");
    }

    double total = 0.0;
    for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
        double v = options.background[b];
        if (!std::isfinite(v) || v <= 0.0) {
            throw InvalidParameterError(std::string("background[") + ALPHABET[b] + "]",
                                        format_double(v), "must be positive");
        }
        total += v;
    }
    for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
        result.background[b] = options.background[b] / total;
    }

    return result;
}

// ============================================================================
// MatrixConverter
// ============================================================================

MatrixConverter::MatrixConverter(const ConverterOptions& options)
    : options_(normalize_options(options)) {}

void MatrixConverter::validate_row(const MatrixRow& row, const std::string& motif_name,
                                   size_t row_index) const {
    double sum = 0.0;
    for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
        if (!std::isfinite(row[b]) || row[b] < 0.0) {
            throw MalformedMatrixError(motif_name,
                "row " + std::to_string(row_index + 1) + " has invalid frequency " +
                format_double(row[b]) + " for base " + ALPHABET[b]);
        }
        sum += row[b];
    }

    if (std::fabs(sum - 1.0) > options_.tolerance) {
        throw MalformedMatrixError(motif_name,
            "row " + std::to_string(row_index + 1) + " sums to " + format_double(sum) +
            " (expected 1 +/- " + format_double(options_.tolerance) + ")");
    }
}

MatrixRow MatrixConverter::convert_row(const MatrixRow& pwm_row, const std::string& motif_name,
                                       size_t row_index) const {
    validate_row(pwm_row, motif_name, row_index);

    MatrixRow floored;
    for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
        floored[b] = std::max(pwm_row[b], options_.pseudocount);
    }

    MatrixRow reference = options_.background;
    if (options_.reference == EnergyReference::CONSENSUS) {
        double max_freq = *std::max_element(floored.begin(), floored.end());
        reference.fill(max_freq);
    }

    MatrixRow energies;
    for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
        energies[b] = -options_.rt * std::log(floored[b] / reference[b]);
    }
    return energies;
}

Matrix MatrixConverter::convert(const Matrix& pwm, const std::string& motif_name) const {
    Matrix ewm;
    ewm.reserve(pwm.size());
    for (size_t i = 0; i < pwm.size(); ++i) {
        ewm.push_back(convert_row(pwm[i], motif_name, i));
    }
    return ewm;
}

// ============================================================================
// MotifMatrix
// ============================================================================

MotifMatrix::MotifMatrix(std::string name, Matrix pwm, const MatrixConverter& converter)
    : MotifMatrix(std::move(name), std::string(), 0, std::move(pwm), converter) {}

MotifMatrix::MotifMatrix(std::string name, std::string alt_name, int nsites, Matrix pwm,
                         const MatrixConverter& converter)
    : name_(std::move(name)), alt_name_(std::move(alt_name)), nsites_(nsites),
      pwm_(std::move(pwm)) {

    if (pwm_.empty()) {
        throw MalformedMatrixError(name_, "matrix has no positions");
    }

    ewm_ = converter.convert(pwm_, name_);
    cache_worst_energies();
}

MotifMatrix MotifMatrix::from_energies(std::string name, Matrix ewm) {
    MotifMatrix motif;
    motif.name_ = std::move(name);

    if (ewm.empty()) {
        throw MalformedMatrixError(motif.name_, "matrix has no positions");
    }
    for (size_t i = 0; i < ewm.size(); ++i) {
        for (double e : ewm[i]) {
            if (!std::isfinite(e)) {
                throw MalformedMatrixError(motif.name_,
                    "row " + std::to_string(i + 1) + " has a non-finite energy");
            }
        }
    }

    motif.ewm_ = std::move(ewm);
    motif.cache_worst_energies();
    return motif;
}

void MotifMatrix::cache_worst_energies() {
    worst_energy_.clear();
    worst_energy_.reserve(ewm_.size());
    for (const auto& row : ewm_) {
        worst_energy_.push_back(*std::max_element(row.begin(), row.end()));
    }
}

double MotifMatrix::best_total_energy() const {
    double total = 0.0;
    for (const auto& row : ewm_) {
        total += *std::min_element(row.begin(), row.end());
    }
    return total;
}

std::string MotifMatrix::consensus() const {
    std::string result;
    result.reserve(ewm_.size());
    for (const auto& row : ewm_) {
        auto best = std::min_element(row.begin(), row.end());
        result += ALPHABET[static_cast<size_t>(best - row.begin())];
    }
    return result;
}

bool MotifMatrix::is_palindromic(double tolerance) const {
    const size_t w = ewm_.size();
    for (size_t i = 0; i < w; ++i) {
        for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
            double mirrored = ewm_[w - 1 - i][complement_code(static_cast<uint8_t>(b))];
            if (std::fabs(ewm_[i][b] - mirrored) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

} // namespace tfbs
