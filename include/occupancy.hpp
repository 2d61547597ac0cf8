/**
 * Occupancy Engine
 *
 * - Sequence scanning: summed window energies on both strands
 * - Occupancy: stable 1 / (1 + exp(E - mu))
 * - Landscapes: per-motif occupancy arrays for one sequence
 * - LandscapeAggregator: multi-motif site table at or above a cutoff
 *
 * Strand convention: a site at position p covers forward-strand bases p .. p+w-1
 * on both strands. On the reverse strand the motif is read along the
 * complement strand, so motif column i is matched against
 * complement(seq[p + w - 1 - i]).
 */

#ifndef OCCUPANCY_HPP
#define OCCUPANCY_HPP

#include "tfbs_scanner.hpp"
#include "motif_matrix.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tfbs {

// ============================================================================
// Sequence scanning
// ============================================================================

/**
 * Window energies for one motif; both arrays have one entry per valid start
 * position (empty when the sequence is shorter than the motif)
 */
struct EnergyLandscape {
    std::vector<double> forward;
    std::vector<double> reverse;
};

/**
 * Energy of every window on both strands.
 * Ambiguous symbols score the least favorable energy of their motif column.
 */
EnergyLandscape energy_landscape(const std::string& sequence, const MotifMatrix& motif);

/**
 * Same as above for a pre-encoded sequence (see encode_sequence)
 */
EnergyLandscape energy_landscape(const std::vector<uint8_t>& codes, const MotifMatrix& motif);

/**
 * Energy of the single window starting at position on the given strand.
 * Caller guarantees position + motif.width() <= codes.size().
 */
double window_energy(const std::vector<uint8_t>& codes, std::size_t position,
                     Strand strand, const MotifMatrix& motif);

// ============================================================================
// Occupancy
// ============================================================================

/**
 * Boltzmann occupancy 1 / (1 + exp(energy - mu)), finite and within [0, 1]
 * for every finite input
 */
double occupancy(double energy, double mu);

/**
 * Occupancy landscape of one motif over one sequence
 */
struct OccupancyLandscape {
    std::string motif;
    std::size_t motif_length = 0;
    std::vector<double> forward;
    std::vector<double> reverse;

    /**
     * Number of valid start positions
     */
    std::size_t size() const { return forward.size(); }

    /**
     * Expected number of bound molecules: sum over positions and strands
     */
    double expected_bound() const;

    double max_occupancy() const;
};

OccupancyLandscape occupancy_landscape(const std::string& sequence,
                                       const MotifMatrix& motif, double mu);

OccupancyLandscape occupancy_landscape(const std::vector<uint8_t>& codes,
                                       const MotifMatrix& motif, double mu);

/**
 * Landscapes for every motif in the collection, in collection order.
 * Motifs are independent; no cross-motif normalization.
 */
std::vector<OccupancyLandscape> total_landscape(const std::string& sequence,
                                                const MotifCollection& motifs, double mu);

// ============================================================================
// Aggregation
// ============================================================================

/**
 * All (position, strand) entries of the landscapes as sites, ordered by
 * position, motif name, strand. No cutoff applied.
 */
std::vector<BindingSite> landscape_to_sites(const std::string& label,
                                            const std::vector<OccupancyLandscape>& landscapes);

/**
 * Sites at or above cutoff, built directly from the landscapes in the same
 * order as landscape_to_sites. Equals filter_sites(landscape_to_sites(...))
 * without materializing the rows below the cutoff.
 */
std::vector<BindingSite> sites_above_cutoff(const std::string& label,
                                            const std::vector<OccupancyLandscape>& landscapes,
                                            double cutoff);

/**
 * Drop sites with occupancy strictly below cutoff; order is preserved
 */
std::vector<BindingSite> filter_sites(const std::vector<BindingSite>& sites, double cutoff);

/**
 * Sort sites into the deterministic per-sequence order
 */
void sort_sites(std::vector<BindingSite>& sites);

/**
 * Dense per-position table (one row per sequence position, two columns per
 * motif), positions without a valid window padded with 0
 */
struct DenseLandscape {
    std::vector<std::string> columns;          // "<motif>_F", "<motif>_R", ...
    std::vector<std::vector<double>> rows;     // rows[position][column]
};

DenseLandscape dense_landscape(std::size_t sequence_length,
                               const std::vector<OccupancyLandscape>& landscapes);

/**
 * Runs the scan -> occupancy -> site table pipeline for one sequence against
 * a shared, read-only motif collection. Stateless per call and safe to use
 * from several threads at once.
 */
class LandscapeAggregator {
public:
    LandscapeAggregator(SharedMotifCollection motifs, const ScanParams& params);

    /**
     * Per-motif landscapes, cutoff-independent
     */
    std::vector<OccupancyLandscape> landscapes(const std::string& sequence) const;

    /**
     * Ordered sites at or above the configured cutoff
     */
    std::vector<BindingSite> scan(const std::string& label, const std::string& sequence) const;

    /**
     * Ordered sites at or above the configured cutoff from precomputed landscapes
     */
    std::vector<BindingSite> sites(const std::string& label,
                                   const std::vector<OccupancyLandscape>& landscapes) const;

    const MotifCollection& motifs() const { return *motifs_; }
    const ScanParams& params() const { return params_; }

private:
    SharedMotifCollection motifs_;
    ScanParams params_;
};

} // namespace tfbs

#endif // OCCUPANCY_HPP
